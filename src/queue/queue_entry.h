#ifndef PAGESTREAM_SRC_QUEUE_QUEUE_ENTRY_H_
#define PAGESTREAM_SRC_QUEUE_QUEUE_ENTRY_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace Pagestream {

// Flattened event. The queue only carries string scalars.
using QueueFields = std::map<std::string, std::string>;

/**
 * Queue entry id, "<unix-ms>-<seq>". Strictly increasing within one queue.
 */
struct EntryId {
	uint64_t ms = 0;
	uint64_t seq = 0;

	std::string ToString() const;
	static std::optional<EntryId> Parse(absl::string_view text);

	absl::Time Timestamp() const { return absl::FromUnixMillis(static_cast<int64_t>(ms)); }

	bool operator==(const EntryId& o) const { return ms == o.ms && seq == o.seq; }
	bool operator!=(const EntryId& o) const { return !(*this == o); }
	bool operator<(const EntryId& o) const { return ms < o.ms || (ms == o.ms && seq < o.seq); }
};

struct QueueEntry {
	EntryId id;
	QueueFields fields;
	absl::Time enqueued_at;
	// 1 on first claim; higher values mean redelivery after an expired lease.
	uint32_t delivery_count = 0;
};

struct QueueStats {
	uint64_t length = 0;   // entries in the log since it was last compacted
	uint64_t pending = 0;  // claimed, not yet acknowledged
	uint64_t backlog = 0;  // appended, never claimed
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_QUEUE_QUEUE_ENTRY_H_
