#pragma once

#include "core/types.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace wg::service {

class NavigationService;

/// Text front end standing in for the camera, GPS and microphone adapters.
/// One command per line:
///
///     scan <code>          decoded QR text
///     dest <phrase>        recognized destination phrase ("a 7")
///     gps <lat> <lon>      position fix
///     cancel [reason]
///     wait <ms>            let events settle, then pause (replay files)
///     status               log the monitoring snapshot
///     quit
///
/// Blank lines and lines starting with '#' are skipped.
class ConsoleAdapter {
public:
    explicit ConsoleAdapter(NavigationService& service);

    /// Execute one command. Returns false when the session should end.
    bool execute(std::string_view line);

    /// Execute commands until EOF or quit. Returns the number executed.
    u64 run(std::istream& in);

    u64 rejected_count() const { return rejected_; }

private:
    void log_status();

    NavigationService& service_;
    u64 rejected_ = 0;
};

/// One-line rendering of a snapshot for the log / status display.
std::string describe_snapshot(const NavigationService& service);

} // namespace wg::service
