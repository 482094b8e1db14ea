#include "dirgen.h"
#include "config.h"
#include "server/control.h"
#include "server/control_api.h"
#include "run/orchestrator.h"
#include "run/run_registry.h"
#include "workers/supervisor.h"
#include "events/broadcaster.h"
#include "sandbox/sandbox_fs.h"
#include "llm/failover.h"
#include "llm/local_models.h"
#include "llm/providers.h"
#include "llm/response_cache.h"

#include <iostream>
#include <string>
#include <cstring>
#include <getopt.h>
#include <csignal>
#include <memory>
#include <atomic>
#include <thread>
#include <set>
#include <map>
#include <vector>
#include <chrono>

// Global debug level (0=off, 1-9=increasing verbosity)
// Used by dprintf() macro in debug.h for fine-grained debug control
int g_debug_level = 0;

// Set from the signal handler, acted on by the shutdown watcher
static std::atomic<bool> g_shutdown_requested{false};

static void print_usage(int, char** argv) {
	printf("\n=== DirGen - Pipeline Control Plane ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS]\n", argv[0]);
	printf("	%s ctl <status|shutdown> [--socket PATH]\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-c, --config FILE  Specify config file (default: ~/.config/dirgen/config.json)\n");
	printf("	-d, --debug[=N]    Enable debug mode with optional level (1-9, default: 1)\n");
	printf("	-l, --log-file	   Log to file instead of console\n");
	printf("	--host HOST		   Server host to bind to (default: from config)\n");
	printf("	--port PORT		   Server port (default: 8000)\n");
	printf("	--root DIR		   Project root for worker files (default: current directory)\n");
	printf("	--control-socket PATH  Control socket path (default: /var/tmp/dirgen.sock)\n");
	printf("	-v, --version	   Show version information\n");
	printf("	-h, --help		   Show this help message\n");
	printf("\nEnvironment:\n");
	printf("	LLM_PRIORITY_ORDER	  Comma separated provider order (e.g. \"gemini,local\")\n");
	printf("	DMR_ENDPOINT		  Local model runner chat completions URL\n");
	printf("	GEMINI_API_KEY_1..9	  Gemini keys for credential rotation\n");
	printf("\n");
}

static void signal_handler(int signal) {
	(void)signal;
	g_shutdown_requested = true;
}

static std::set<ApprovalKind> gates_from_config(const Config& config) {
	std::set<ApprovalKind> gates;
	for (const auto& name : config.approval_gates) {
		auto kind = parse_approval_kind(name);
		if (!kind) {
			throw ConfigError("Unknown approval gate: " + name);
		}
		gates.insert(*kind);
	}
	return gates;
}

static std::map<Stage, StageCommand> stages_from_config(const Config& config) {
	std::map<Stage, StageCommand> commands;
	for (const auto& [name, cmd] : config.stages) {
		auto stage = parse_stage(name);
		if (!stage) {
			throw ConfigError("Unknown stage: " + name);
		}
		if (cmd.configured()) {
			commands[*stage] = cmd;
		}
	}
	return commands;
}

int main(int argc, char** argv) {
	// Handle ctl subcommand
	if (argc >= 2 && std::string(argv[1]) == "ctl") {
		std::vector<std::string> args;
		for (int i = 2; i < argc; i++) {
			args.push_back(argv[i]);
		}
		return handle_ctl_args(args);
	}

	std::string config_file_path;
	std::string log_file;
	std::string control_socket;

	// Command-line overrides (applied to config after load)
	struct {
		std::string host;
		int port = -1;
		std::string root;
	} override;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"host", required_argument, 0, 1000},
		{"port", required_argument, 0, 1001},
		{"root", required_argument, 0, 1002},
		{"control-socket", required_argument, 0, 1003},
		{"version", no_argument, 0, 'v'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	while ((opt = getopt_long(argc, argv, "c:d::l:vh", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'c':
				config_file_path = optarg;
				break;
			case 'd':
				// Parse optional debug level (default to 1 if not specified)
				if (optarg) {
					g_debug_level = atoi(optarg);
				} else {
					g_debug_level = 1;
				}
				break;
			case 'l':
				log_file = optarg;
				break;
			case 1000: // --host
				override.host = optarg;
				break;
			case 1001: // --port
				override.port = std::atoi(optarg);
				if (override.port <= 0 || override.port > 65535) {
					printf("Error: port must be between 1 and 65535\n");
					return 1;
				}
				break;
			case 1002: // --root
				override.root = optarg;
				break;
			case 1003: // --control-socket
				control_socket = optarg;
				break;
			case 'v':
				printf("DirGen version %s\n", DIRGEN_VERSION);
				return 0;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	// Initialize logger early
	Logger& logger = Logger::instance();
	if (g_debug_level) {
		logger.set_log_level(LogLevel::DEBUG);
		std::cout << "Debug mode enabled (level " << g_debug_level << ")" << std::endl;
	}

	// Load configuration
	auto config = std::make_unique<Config>();
	if (!config_file_path.empty()) {
		config->set_config_path(config_file_path);
	}

	try {
		config->load();
		config->apply_environment();

		if (!override.host.empty()) {
			config->host = override.host;
		}
		if (override.port > 0) {
			config->port = override.port;
		}
		if (!override.root.empty()) {
			config->project_root = override.root;
		}
		if (!log_file.empty()) {
			config->log_file = log_file;
		}

		config->validate();
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	if (!config->log_file.empty()) {
		logger.set_log_file(config->log_file);
		logger.set_console_output(false);
	}

	LOG_INFO("DirGen " + std::string(DIRGEN_VERSION) + " starting");

	std::string callback_url = config->callback_url;
	if (callback_url.empty()) {
		std::string callback_host = config->host == "0.0.0.0" ? "127.0.0.1" : config->host;
		callback_url = "http://" + callback_host + ":" + std::to_string(config->port);
	}

	try {
		SandboxFilesystem sandbox(config->project_root);
		LOG_INFO("Project root: " + sandbox.root().string());

		WorkerSupervisor::Options supervisor_options;
		supervisor_options.working_dir = sandbox.root().string();
		supervisor_options.callback_url = callback_url;
		WorkerSupervisor supervisor(std::make_unique<PosixProcessSpawner>(),
		                            stages_from_config(*config),
		                            supervisor_options);

		EventBroadcaster broadcaster;
		RunRegistry registry;

		Orchestrator::Options orchestrator_options;
		orchestrator_options.max_retries = config->max_retries;
		orchestrator_options.input_dir = config->input_dir;
		orchestrator_options.context_file = config->context_file;
		orchestrator_options.gates = gates_from_config(*config);
		Orchestrator orchestrator(orchestrator_options, registry, supervisor, broadcaster, sandbox);

		LocalModelManager::Options model_options;
		model_options.idle_timeout = std::chrono::seconds(config->local_models.idle_timeout_seconds);
		model_options.max_concurrent = config->local_models.max_concurrent;
		model_options.poll_attempts = config->local_models.poll_attempts;
		model_options.poll_interval = std::chrono::seconds(config->local_models.poll_interval_seconds);
		model_options.sweep_interval = std::chrono::seconds(config->local_models.sweep_interval_seconds);
		model_options.model_prefix = config->local_models.model_prefix;
		LocalModelManager local_models(
			std::make_unique<DockerModelRuntime>(config->local_models.command), model_options);

		auto cache = std::make_shared<ResponseCache>(config->llm.cache_capacity, config->llm.cache_prefix_chars);
		ProviderSet provider_set = build_providers(*config, &local_models);

		FailoverEngine::Options failover_options;
		failover_options.priority_order = config->llm.priority_order;
		failover_options.local_fallback = config->llm.local_fallback;
		FailoverEngine failover(provider_set.providers, failover_options, cache);

		std::string order;
		for (const auto& name : failover.order_for(TaskClass::General)) {
			order += (order.empty() ? "" : ", ") + name;
		}
		LOG_INFO("LLM priority order: " + order);

		ControlApi::Services services;
		services.orchestrator = &orchestrator;
		services.registry = &registry;
		services.supervisor = &supervisor;
		services.broadcaster = &broadcaster;
		services.sandbox = &sandbox;
		services.failover = &failover;
		services.local_models = &local_models;
		services.credential_pools = provider_set.credential_pools;

		ControlApi server(config->host, config->port, services);
		if (!control_socket.empty()) {
			server.set_control_socket_path(control_socket);
		}

		// Set up signal handlers for graceful shutdown
		signal(SIGINT, signal_handler);
		signal(SIGTERM, signal_handler);
		signal(SIGPIPE, SIG_IGN);

		std::atomic<bool> server_done{false};
		std::thread shutdown_watcher([&]() {
			while (!server_done) {
				if (g_shutdown_requested) {
					LOG_INFO("Received shutdown signal, shutting down gracefully...");
					server.shutdown();
					break;
				}
				std::this_thread::sleep_for(std::chrono::milliseconds(200));
			}
		});

		supervisor.start();
		local_models.start();

		int rc = server.run();

		server_done = true;
		shutdown_watcher.join();

		local_models.force_stop_all();
		supervisor.stop();

		LOG_INFO("DirGen stopped");
		return rc;
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	} catch (const SandboxViolation& e) {
		fprintf(stderr, "Invalid project root: %s\n", e.what());
		return 1;
	}
}
