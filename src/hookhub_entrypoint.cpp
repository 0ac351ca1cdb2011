#include "hookhub_common.hpp"
#include "hookhub_entry.hpp"
#include "hookhub_error.hpp"

#include <cstdlib>
#include <iostream>

int RunHookhubApplication(int argc, char *argv[]) {
  try {
    hookhub::CliCtx ctx = hookhub::parse_cli(argc, argv);
    hookhub::App app(ctx);
    return app.Run();
  } catch (const po::error &e) {
    std::cerr << e.what() << std::endl << std::endl;
    hookhub::App::PrintUsage(std::cerr);
    return EXIT_FAILURE;
  } catch (const hookhub::Error &e) {
    std::cerr << "error " << e.code() << ": " << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunHookhubApplication(argc, argv); }
