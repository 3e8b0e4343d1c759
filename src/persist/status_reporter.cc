#include "status_reporter.h"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace Pagestream {

namespace fs = std::filesystem;

namespace {

int64_t CountLines(const fs::path& path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		return -1;
	}
	int64_t lines = 0;
	char buf[64 * 1024];
	while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
		lines += std::count(buf, buf + in.gcount(), '\n');
	}
	if (in.bad()) {
		return -1;
	}
	return lines;
}

absl::Time ToAbslTime(fs::file_time_type t) {
	// The file clock has no portable epoch in C++17.
	auto system_now = std::chrono::system_clock::now();
	auto file_now = fs::file_time_type::clock::now();
	auto as_system = system_now + std::chrono::duration_cast<std::chrono::system_clock::duration>(t - file_now);
	return absl::FromChrono(as_system);
}

} // namespace

StatusReporter::StatusReporter(const BatchDrainLoop& loop, std::string root_dir)
	: loop_(loop), root_dir_(std::move(root_dir)) {}

FileListing StatusReporter::Scan(bool count_lines) const {
	FileListing listing;
	std::error_code ec;
	if (!fs::exists(root_dir_, ec)) {
		return listing;
	}
	try {
		for (fs::recursive_directory_iterator it(root_dir_), end; it != end; ++it) {
			if (!it->is_regular_file() || it->path().extension() != ".jsonl") {
				continue;
			}
			PartitionFileInfo info;
			info.relative_path = fs::relative(it->path(), root_dir_).generic_string();
			info.size_bytes = it->file_size();
			info.modified = ToAbslTime(it->last_write_time());
			if (count_lines) {
				info.line_count = CountLines(it->path());
			}
			listing.total_size_bytes += info.size_bytes;
			listing.files.push_back(std::move(info));
		}
	} catch (const fs::filesystem_error& e) {
		LOG(ERROR) << "Listing partition files under " << root_dir_ << " failed: " << e.what();
		listing.error = e.what();
	}
	std::sort(listing.files.begin(), listing.files.end(),
			[](const PartitionFileInfo& a, const PartitionFileInfo& b) {
				return a.relative_path < b.relative_path;
			});
	listing.total_files = listing.files.size();
	return listing;
}

FileListing StatusReporter::ListFiles() const {
	return Scan(true);
}

ProcessorStatus StatusReporter::Report() const {
	ProcessorStatus status;
	status.processor = loop_.GetStats();
	status.error = status.processor.error;

	FileListing listing = Scan(false);
	status.total_files = listing.total_files;
	status.total_size_bytes = listing.total_size_bytes;
	if (!status.error && listing.error) {
		status.error = listing.error;
	}
	return status;
}

} // namespace Pagestream
