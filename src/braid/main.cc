#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "merge/cancellation.h"
#include "merge/interrupt.h"
#include "merge/merge_error.h"
#include "merge/merge_job.h"
#include "merge/record_filter.h"
#include "merge/time_handler.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitMergeFailed = 1;
constexpr int kExitUsage = 2;

void LogValidationErrors(const Braid::Configuration& config) {
	for (const std::string& error : config.getValidationErrors()) {
		LOG(ERROR) << "Invalid configuration: " << error;
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("braid", "Merge time-ordered line logs into one file");
	options.positional_help("SOURCE...");

	options.add_options()
		("sources", "Source files", cxxopts::value<std::vector<std::string>>())
		("o,output", "Destination file", cxxopts::value<std::string>())
		("src_gzip", "Sources are gzip compressed")
		("dst_gzip", "Write a gzip compressed destination")
		("delete_src", "Delete the sources after a successful merge")
		("m,mode", "Merge mode: ordered or concurrent", cxxopts::value<std::string>())
		("w,workers", "Worker threads for the concurrent mode", cxxopts::value<int>())
		("time_layout", "strptime layout of the leading timestamp", cxxopts::value<std::string>())
		("tag_source", "Prefix every record with [source]")
		("grep", "Keep only records matching this regular expression", cxxopts::value<std::string>())
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	options.parse_positional({"sources"});

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		std::cerr << e.what() << "\n" << options.help() << std::endl;
		return kExitUsage;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return kExitOk;
	}

	FLAGS_v = arguments["log_level"].as<int>();

	Braid::Configuration& config = Braid::Configuration::getInstance();
	if (arguments.count("config")) {
		if (!config.loadFromFile(arguments["config"].as<std::string>())) {
			LOG(ERROR) << "Failed to load configuration from " << arguments["config"].as<std::string>();
			return kExitUsage;
		}
	}
	if (!config.validate()) {
		LogValidationErrors(config);
		return kExitUsage;
	}

	if (!arguments.count("output")) {
		std::cerr << "--output is required\n" << options.help() << std::endl;
		return kExitUsage;
	}

	// Command line values win over the configuration file and the environment
	Braid::MergeJobOptions job;
	if (arguments.count("sources")) {
		job.src_paths = arguments["sources"].as<std::vector<std::string>>();
	}
	job.dst_path = arguments["output"].as<std::string>();
	job.src_gzip = arguments.count("src_gzip") > 0;
	job.dst_gzip = arguments.count("dst_gzip") > 0;
	job.delete_src = arguments.count("delete_src") > 0;
	job.workers = arguments.count("workers") ? arguments["workers"].as<int>() : config.getWorkerCount();
	job.queue_capacity = config.getQueueCapacity();
	job.poll_interval = std::chrono::milliseconds(config.getPollIntervalMs());
	job.read_buffer_size = config.getReadBufferSize();
	job.gzip_level = config.getGzipLevel();

	std::string mode = arguments.count("mode") ? arguments["mode"].as<std::string>() : config.getMergeMode();
	try {
		job.mode = Braid::ParseMergeMode(mode);
	} catch (const Braid::ConfigurationError& e) {
		std::cerr << e.what() << std::endl;
		return kExitUsage;
	}

	std::string layout = arguments.count("time_layout") ?
		arguments["time_layout"].as<std::string>() : config.getTimeLayout();
	Braid::LayoutTimeHandler time_handler(layout);
	job.time_handler = &time_handler;

	Braid::FilterChain filters;
	if (arguments.count("grep")) {
		try {
			filters.Then(std::make_unique<Braid::PatternFilter>(arguments["grep"].as<std::string>()));
		} catch (const std::regex_error& e) {
			std::cerr << "Invalid --grep pattern: " << e.what() << std::endl;
			return kExitUsage;
		}
	}
	// Tag after matching so the pattern never sees the label
	if (arguments.count("tag_source") || config.getTagSource()) {
		filters.Then(std::make_unique<Braid::SourceTagFilter>());
	}
	job.filter = filters.empty() ? nullptr : &filters;

	std::atomic<int> source_failures{0};
	job.on_error = [&source_failures](const Braid::MergeError& error) {
		source_failures.fetch_add(1);
		LOG(WARNING) << "Source " << error.source() << " left out of the merge ("
			<< Braid::KindName(error.kind()) << ")";
	};
	static Braid::CancellationToken cancel;
	job.cancel = &cancel;

	// Only the concurrent mode polls the token; ordered runs keep the default SIGINT
	Braid::InstallInterruptHandlers(job.mode, &cancel);

	try {
		Braid::MergeSummary summary = Braid::RunMergeJob(job);
		VLOG(1) << "Timestamps accepted " << time_handler.accepted() << ", skipped " << time_handler.skipped();
		if (summary.cancelled) {
			LOG(WARNING) << "Merge interrupted";
			return kExitMergeFailed;
		}
		if (source_failures.load() > 0) {
			return kExitMergeFailed;
		}
	} catch (const Braid::ConfigurationError& e) {
		LOG(ERROR) << e.what();
		return kExitUsage;
	} catch (const Braid::MergeError& e) {
		LOG(ERROR) << "Merge failed (" << Braid::KindName(e.kind()) << "): " << e.what();
		return kExitMergeFailed;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Merge failed: " << e.what();
		return kExitMergeFailed;
	}

	return kExitOk;
}
