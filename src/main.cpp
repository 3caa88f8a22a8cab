#include "cli_options.hpp"
#include "ini_task.hpp"
#include "terminal.hpp"
#include <iostream>
#include <unistd.h>

int main(int argc, char** argv) {
  CliOptions opts;
  std::string msg;
  if (!opts.parse_args(argc, argv, msg)) {
    std::cerr << "iniedit: " << msg << "\n" << CliOptions::usage();
    return 2;
  }
  if (opts.show_help) {
    std::cout << CliOptions::usage();
    return 0;
  }
  if (!opts.load_rc(msg)) {
    std::cerr << "iniedit: " << msg << "\n";
    return 2;
  }
  if (!msg.empty()) std::cerr << "iniedit: " << msg << "\n";
  if (!opts.validate(msg)) {
    std::cerr << "iniedit: " << msg << "\n" << CliOptions::usage();
    return 2;
  }

  bool changed = false;
  bool ok = run_request(opts.request, opts.settings.write_mode(), changed, msg);
  if (!ok) {
    Terminal err(STDERR_FILENO, opts.settings.color);
    std::cerr << err.paint("failed: ", Tone::Failed) << opts.request.dest.string() << ": " << msg << "\n";
    return 1;
  }
  if (!opts.settings.quiet) {
    Terminal out(STDOUT_FILENO, opts.settings.color);
    if (changed && opts.request.check) std::cout << out.paint("would change: ", Tone::Changed);
    else if (changed) std::cout << out.paint("changed: ", Tone::Changed);
    else std::cout << out.paint("ok: ", Tone::Ok);
    std::cout << opts.request.dest.string() << "\n";
  }
  return 0;
}
