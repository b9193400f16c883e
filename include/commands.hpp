#pragma once
#include <iosfwd>

namespace cli {

// Subcommand handlers. argv[1] is the subcommand name; results go to out,
// usage text and error lines to err. Return the process exit code.
int handle_train(int argc, char* argv[], std::ostream& out, std::ostream& err);
int handle_encode(int argc, char* argv[], std::ostream& out, std::ostream& err);
int handle_decode(int argc, char* argv[], std::ostream& out, std::ostream& err);

// Dispatches on argv[1]. Errors raised by a handler are written to err and
// also logged, and give exit code 1.
int run_command(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace cli
