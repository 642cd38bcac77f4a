#include "lucent/cli.hpp"
#include "lucent/application.hpp"
#include "lucent/config.hpp"
#include "lucent/demo.hpp"
#include "lucent/entity_store.hpp"
#include "lucent/logging.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace lucent::cli
{

	namespace
	{
		Result<AppConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_string("");
			return ConfigLoader::load(path);
		}

		void print_response(const Response &res)
		{
			std::cout << "HTTP " << res.status << "\n";
			for (const auto &[name, value] : res.headers)
				std::cout << name << ": " << value << "\n";
			std::cout << "\n"
					  << res.body << std::endl;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Lucent dispatch runtime"};
		app.prefix_command();

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		std::string req_method{"GET"};
		std::string req_path;
		std::string req_body;
		std::vector<std::string> req_headers;
		auto req_cmd = app.add_subcommand("request", "Dispatch one HTTP request and print the response");
		req_cmd->add_option("--method", req_method, "HTTP method (default GET)");
		req_cmd->add_option("--path", req_path, "Request target, with optional query string")->required();
		req_cmd->add_option("--body", req_body, "Request body");
		req_cmd->add_option("--header", req_headers, "Header as \"Name: value\" (repeatable)");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		Application application(*cfg);
		try
		{
			configure_logging(cfg->logging);
			application.set_entity_store(std::make_shared<RocksDbEntityStore>(cfg->storage));
		}
		catch (const std::exception &e)
		{
			std::cerr << e.what() << std::endl;
			return 1;
		}

		auto installed = demo::install(application);
		if (!installed)
		{
			std::cerr << installed.error().what() << std::endl;
			return 1;
		}
		auto booted = application.boot();
		if (!booted)
		{
			std::cerr << booted.error().what() << std::endl;
			return 1;
		}

		if (*req_cmd)
		{
			HttpRequest request;
			request.method = req_method;
			request.target = req_path;
			request.body = req_body;
			for (const auto &line : req_headers)
			{
				auto colon = line.find(':');
				if (colon == std::string::npos)
				{
					std::cerr << "Malformed header: " << line << std::endl;
					return 1;
				}
				request.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
			}

			auto response = application.handle(request);
			if (!response)
			{
				std::cerr << error_code_to_string(response.error().code) << ": " << response.error().what() << std::endl;
				return 2;
			}
			print_response(*response);
			return response->status >= 400 ? 2 : 0;
		}

		auto tokens = app.remaining();
		if (tokens.empty())
		{
			std::cout << app.help() << std::endl;
			return 0;
		}

		auto output = application.run_command(tokens);
		if (!output)
		{
			std::cerr << error_code_to_string(output.error().code) << ": " << output.error().what() << std::endl;
			return 2;
		}
		std::cout << *output << std::endl;
		return 0;
	}

} // namespace lucent::cli
