#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../async/task_executor.h"
#include "../common/config.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../io/console_adjustment.h"
#include "../io/file_store.h"
#include "../pipeline/conversation.h"
#include "../pipeline/update_pipeline.h"
#include "../record/transform.h"

namespace {

// A joined run that failed before its write may leave the prompt task on a blocking stdin read;
// leave without joining it
[[noreturn]] void ExitAbandoned() {
	google::FlushLogFiles(google::GLOG_INFO);
	std::cout << std::flush;
	std::_Exit(EXIT_FAILURE);
}

void ApplyCommandLine(const cxxopts::ParseResult& arguments, Rendezvous::RendezvousConfig& config) {
	if (arguments.count("file")) {
		config.data.path.set(arguments["file"].as<std::string>());
	}
	if (arguments.count("mode")) {
		config.pipeline.mode.set(arguments["mode"].as<std::string>());
	}
	if (arguments.count("timeout_ms")) {
		config.pipeline.timeout_ms.set(arguments["timeout_ms"].as<int64_t>());
	}
	if (arguments.count("workers")) {
		config.pipeline.worker_threads.set(arguments["workers"].as<int64_t>());
	}
	if (arguments.count("lenient")) {
		config.prompt.lenient.set(true);
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("rendezvous", "Reads records and an age adjustment concurrently, joins them and writes the records back");

	options.add_options()
		("f,file", "Data file (default " + std::string(kDefaultDataPath) + ")",
		 cxxopts::value<std::string>())
		("m,mode", "Run mode: sequential, joined or actor (default joined)", cxxopts::value<std::string>())
		("t,timeout_ms", "Bound on waiting for the joined run, 0 waits forever",
		 cxxopts::value<int64_t>())
		("w,workers", "Executor threads (default " + std::to_string(kDefaultWorkerThreads) + ")",
		 cxxopts::value<int64_t>())
		("lenient", "Treat an invalid adjustment as 0")
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid command line: " << e.what();
		std::cerr << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();

	// *************** Configuration **********************
	// Precedence: defaults < YAML file < command line; RENDEZVOUS_* env vars win over all
	Rendezvous::Configuration& configuration = Rendezvous::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string config_file = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(config_file)) {
			LOG(ERROR) << "Failed to load configuration from " << config_file;
			return EXIT_FAILURE;
		}
	}
	ApplyCommandLine(arguments, configuration.config());

	// Validate once every source is applied
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	const Rendezvous::RendezvousConfig& config = configuration.config();
	const std::string data_path = configuration.getDataPath();
	const std::string mode = configuration.getMode();
	const std::chrono::milliseconds timeout(configuration.getTimeoutMs());

	// *************** Wire the run **********************
	Rendezvous::TaskExecutor executor(static_cast<size_t>(configuration.getWorkerThreads()));
	LOG(INFO) << "Starting rendezvous mode:" << mode << " file:" << data_path
	          << " workers:" << executor.num_threads();
	Rendezvous::FileSourceProvider source(data_path, executor);
	Rendezvous::FileSink sink(data_path, executor);

	Rendezvous::PromptOptions prompt_options;
	prompt_options.prompt = config.prompt.text.get();
	prompt_options.lenient = config.prompt.lenient.get();
	Rendezvous::ConsoleAdjustmentProvider prompt(std::cin, std::cout, executor, prompt_options);

	Rendezvous::AgeChangeListener listener = [](const Rendezvous::AgeChange& change) {
		std::cout << Rendezvous::FormatAgeChange(change) << std::endl;
	};

	std::unique_ptr<Rendezvous::UpdatePipeline> pipeline;
	try {
		Rendezvous::RunReport report;
		if (mode == "sequential") {
			pipeline = std::make_unique<Rendezvous::UpdatePipeline>(source, prompt, sink, listener);
			report = pipeline->RunSequential();
		} else if (mode == "actor") {
			if (timeout.count() > 0) {
				LOG(WARNING) << "timeout_ms is ignored in actor mode";
			}
			Rendezvous::ConversationOptions conversation_options;
			conversation_options.shutdown_delay =
				std::chrono::milliseconds(config.conversation.shutdown_delay_ms.get());
			Rendezvous::Conversation conversation(source, prompt, sink, conversation_options, listener);
			report = conversation.Run();
		} else {
			pipeline = std::make_unique<Rendezvous::UpdatePipeline>(source, prompt, sink, listener);
			report = pipeline->Run(timeout);
		}
		LOG(INFO) << "Updated " << report.records_written << " records in " << source.path();
	} catch (...) {
		std::exception_ptr error = std::current_exception();
		LOG(ERROR) << "Run failed: " << Rendezvous::DescribeError(error);
		// Past the join nothing reads stdin; the executor finishes the write on the way out
		if (mode == "joined" && (!pipeline || pipeline->state() != Rendezvous::RunState::kWriting)) {
			ExitAbandoned();
		}
		return EXIT_FAILURE;
	}

	executor.Stop();
	return EXIT_SUCCESS;
}
