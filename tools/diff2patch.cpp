#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <DiffToPatch/Json.hpp>
#include <DiffToPatch/Pipeline.hpp>

using namespace DiffToPatch;

static bool read_file(const std::string &path, std::string &out) {
	std::ifstream in(path, std::ios::binary);
	if(!in) {
		return false;
	}
	std::ostringstream ss;
	ss << in.rdbuf();
	out = ss.str();
	return true;
}

static int usage(const char *argv0) {
	std::cerr << "Usage: " << argv0 << " <document.json> <diff.txt> [-c <options.json>] [-i <indent>] [-v]" << std::endl;
	return 1;
}

int main(int argc, char *argv[]) {
	std::vector<std::string> positional;
	std::string options_path;
	int indent = 2;
	bool verbose = false;

	for(int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if(arg == "-v") {
			verbose = true;
		} else if(arg == "-c") {
			if(i + 1 >= argc) {
				return usage(argv[0]);
			}
			options_path = argv[++i];
		} else if(arg == "-i") {
			if(i + 1 >= argc) {
				return usage(argv[0]);
			}
			try {
				indent = std::stoi(argv[++i]);
			} catch(const std::logic_error &) {
				std::cerr << "Error: -i requires a number" << std::endl;
				return 1;
			}
		} else if(arg.size() > 1 && arg[0] == '-') {
			return usage(argv[0]);
		} else {
			positional.push_back(arg);
		}
	}
	if(positional.size() != 2) {
		return usage(argv[0]);
	}

	std::string document, raw_diff;
	for(auto [path, out]: {std::pair {&positional[0], &document}, std::pair {&positional[1], &raw_diff}}) {
		if(!read_file(*path, *out)) {
			std::cerr << "Error: cannot read " << *path << std::endl;
			return 1;
		}
	}

	Pipeline pipeline;
	if(!options_path.empty()) {
		std::string contents;
		if(!read_file(options_path, contents)) {
			std::cerr << "Error: cannot read " << options_path << std::endl;
			return 1;
		}
		try {
			pipeline.options = PipelineOptions::fromJSONBuffer(contents);
		} catch(const Json::exception &e) {
			std::cerr << "Error: invalid options in " << options_path << ": " << e.what() << std::endl;
			return 1;
		}
	}
	if(verbose) {
		pipeline.tracing = &std::cerr;
	}

	auto result_some = pipeline.run(document, raw_diff);
	if(!result_some) {
		std::cerr << result_some.error();
		return 2;
	}

	auto &result = *result_some;
	Json out {
		{"patches", to_json_patch(result.patches)},
		{"skippedHunks", result.skipped_hunks},
		{"repaired", result.repaired},
	};
	std::cout << out.dump(indent, ' ', false, Json::error_handler_t::replace) << std::endl;
	return 0;
}
