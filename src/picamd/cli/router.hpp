#pragma once

namespace picamd::cli {

// Routes `picamd` subcommands and returns process exit codes with a stable
// contract for scripts and service managers:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => the camera device could not be used
int Dispatch(int argc, char** argv);

} // namespace picamd::cli
