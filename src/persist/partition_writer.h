#ifndef PAGESTREAM_SRC_PERSIST_PARTITION_WRITER_H_
#define PAGESTREAM_SRC_PERSIST_PARTITION_WRITER_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "batch_writer.h"
#include "common/time_util.h"

namespace Pagestream {

/**
 * Appends drained entries to hourly JSON-lines files:
 *
 *   {root}/{YYYY}/{MM}/{DD}/events_{YYYY}-{MM}-{DD}-{HH}.jsonl
 *
 * The hour is taken from the event's own timestamp. Each partition group
 * of a batch is written with one open/append/fsync/close; a group that
 * fails is rolled back to its previous length when possible and does not
 * stop the remaining groups.
 */
class PartitionWriter final : public BatchWriter {
	public:
		struct Record {
			absl::CivilHour hour;  // UTC hour of the event
			nlohmann::ordered_json json;
		};

		explicit PartitionWriter(std::string root_dir, Clock clock = SystemClock());

		// Creates the storage root. Throws FatalConfigError if it cannot.
		void EnsureRoot() const;

		BatchWriteResult WriteBatch(const std::vector<QueueEntry>& batch) override;

		// Builds the on-disk record for |entry| as processed at |processed_at|.
		static Record BuildRecord(const QueueEntry& entry, absl::Time processed_at);

		// "2024-01-15-14"; the year is always at least four digits.
		static std::string PartitionName(absl::CivilHour hour);

		// Path of the partition file for |hour|, relative to the root.
		static std::string RelativePartitionPath(absl::CivilHour hour);

		const std::string& root_dir() const { return root_dir_; }

	private:
		void AppendGroup(absl::CivilHour hour, const std::string& lines) const;

		const std::string root_dir_;
		Clock clock_;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_PERSIST_PARTITION_WRITER_H_
