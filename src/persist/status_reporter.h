#ifndef PAGESTREAM_SRC_PERSIST_STATUS_REPORTER_H_
#define PAGESTREAM_SRC_PERSIST_STATUS_REPORTER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "batch_drain_loop.h"

namespace Pagestream {

struct PartitionFileInfo {
	std::string relative_path;
	uint64_t size_bytes = 0;
	absl::Time modified;
	// -1 when the file could not be read.
	int64_t line_count = -1;
};

struct FileListing {
	std::vector<PartitionFileInfo> files;  // sorted by relative_path
	uint64_t total_files = 0;
	uint64_t total_size_bytes = 0;
	std::optional<std::string> error;
};

struct ProcessorStatus {
	BatchDrainLoop::Stats processor;
	uint64_t total_files = 0;
	uint64_t total_size_bytes = 0;
	// First failure met while gathering; the other fields are best effort.
	std::optional<std::string> error;
};

/**
 * Read-only view over the drain loop and the partition files. Never throws:
 * failures are reported through the error fields.
 */
class StatusReporter {
	public:
		StatusReporter(const BatchDrainLoop& loop, std::string root_dir);

		ProcessorStatus Report() const;
		FileListing ListFiles() const;

	private:
		FileListing Scan(bool count_lines) const;

		const BatchDrainLoop& loop_;
		const std::string root_dir_;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_PERSIST_STATUS_REPORTER_H_
