#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

namespace rplayer {

// Install the process-wide spdlog logger. With an empty log_file output
// goes to stderr; otherwise it is appended to the file (used while the
// terminal belongs to the ncurses panel).
void init_logging(bool debug, const std::string& log_file = "");

} // namespace rplayer

#endif // LOGGING_HPP
