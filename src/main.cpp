#include "app.hpp"
#include "configuration.hpp"
#include "error.hpp"
#include "context.hpp"
#include <iostream>

namespace
{

/**
 * Cross-platform main function.
 * @return the process exit code
 */
int reel_main(int argc, const char* argv[]) noexcept;

}

int main(int argc, const char* argv[])
{
	return reel_main(argc, argv);
}

namespace
{

int reel_main(int argc, const char* argv[]) noexcept
{
	try {
		Configuration configuration;
		const std::filesystem::path CONFIG_PATH{std::string(APP_NAME) + ".conf"};
		if(std::filesystem::is_regular_file(CONFIG_PATH)) {
			configuration.read_from_file(CONFIG_PATH);
		}
		configuration.read_from_args(argc, argv);

		configure_context(configuration);
		Log::info("%s started.", APP_NAME);

		run(configuration, std::cout);
		return 0;
	}
	catch(const std::exception& ex) {
		show_error(ex);
		return 1;
	}
	catch(...) {
		Log::error("Unknown exception occurred.");
		std::cerr << "Unknown exception occurred.\n";
		return 1;
	}
}

}
