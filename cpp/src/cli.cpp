#include "cosign/cli.hpp"
#include "cosign/auth.hpp"
#include "cosign/config.hpp"
#include "cosign/crypto.hpp"
#include "cosign/engine.hpp"
#include "cosign/proposal.hpp"
#include "cosign/signature_verifier.hpp"
#include "cosign/web_server.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace cosign::cli
{
	namespace
	{
		Result<CosignConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::defaults();
			return ConfigLoader::load(path);
		}

		Result<std::string> read_file(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
				return std::unexpected(CosignError::invalid_input("Unable to open " + path));
			std::stringstream buf;
			buf << f.rdbuf();
			return buf.str();
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"cosign multi-signature proposal coordinator"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print the effective config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path");

		std::string key_out;
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 validator keypair");
		keygen_cmd->add_option("--out", key_out, "Output file path (defaults to stdout)");

		std::string sign_key_path;
		std::string sign_proposal_path;
		std::string sign_kind{"social"};
		auto sign_cmd = app.add_subcommand("sign", "Sign a proposal's canonical payload as a validator device");
		sign_cmd->add_option("--key", sign_key_path, "Path to Ed25519 keypair JSON (base64 fields)")->required();
		sign_cmd->add_option("--proposal", sign_proposal_path, "Path to proposal JSON as returned by the API")->required();
		sign_cmd->add_option("--kind", sign_kind, "Validator kind: social, passkey or hardware");

		std::string token_user;
		auto token_cmd = app.add_subcommand("token", "Issue a bearer token for a user");
		token_cmd->add_option("--user", token_user, "User id")->required();

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the HTTP and WebSocket server");
		serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads (overrides config)");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}
		spdlog::set_level(spdlog::level::from_str(cfg->log_level));

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*keygen_cmd)
		{
			auto kp = crypto::Ed25519KeyPair::generate();
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			if (key_out.empty())
			{
				std::cout << kp->to_json() << std::endl;
				return 0;
			}
			std::ofstream out(key_out);
			if (!out.is_open())
			{
				std::cerr << "Unable to open output file" << std::endl;
				return 1;
			}
			out << kp->to_json() << std::endl;
			std::cout << kp->public_key_b64() << std::endl;
			return 0;
		}

		if (*sign_cmd)
		{
			auto key_json = read_file(sign_key_path);
			if (!key_json)
			{
				std::cerr << key_json.error().what() << std::endl;
				return 1;
			}
			auto kp = crypto::Ed25519KeyPair::from_json(*key_json);
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			auto kind = validator_kind_from_string(sign_kind);
			if (!kind)
			{
				std::cerr << kind.error().what() << std::endl;
				return 1;
			}

			auto proposal_text = read_file(sign_proposal_path);
			if (!proposal_text)
			{
				std::cerr << proposal_text.error().what() << std::endl;
				return 1;
			}
			auto parsed = nlohmann::json::parse(*proposal_text, nullptr, false);
			if (parsed.is_discarded())
			{
				std::cerr << "Proposal file is not JSON" << std::endl;
				return 1;
			}
			// accept either the bare proposal or an API envelope
			if (parsed.contains("data") && parsed["data"].is_object())
				parsed = parsed["data"];
			auto proposal = Proposal::from_json(parsed);
			if (!proposal)
			{
				std::cerr << proposal.error().what() << std::endl;
				return 1;
			}

			auto input = SodiumSignatureVerifier::signing_input(proposal->canonical_payload(), *kind);
			auto sig = kp->sign(input);
			std::cout << crypto::Base64::encode(crypto::Bytes(sig.begin(), sig.end())) << std::endl;
			return 0;
		}

		if (*token_cmd)
		{
			TokenAuthenticator auth(cfg->auth, system_clock());
			std::cout << auth.issue(token_user) << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			auto engine = Engine::open(*cfg);
			if (!engine)
			{
				std::cerr << engine.error().what() << std::endl;
				return 1;
			}
			auto wsc = WebServerConfig::from(*cfg);
			if (serve_port)
				wsc.port = *serve_port;
			if (serve_threads)
				wsc.threads = *serve_threads;

			std::shared_ptr<Engine> shared = std::move(*engine);
			WebServer server(shared, wsc);
			server.run();
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace cosign::cli
