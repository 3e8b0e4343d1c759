#ifndef PAGESTREAM_SRC_PERSIST_BATCH_WRITER_H_
#define PAGESTREAM_SRC_PERSIST_BATCH_WRITER_H_

#include <cstddef>
#include <vector>

#include "queue/queue_entry.h"

namespace Pagestream {

enum class BatchWriteStatus {
	kSuccess,
	// At least one partition group was not fully written.
	kPartialFailure,
};

struct BatchWriteResult {
	BatchWriteStatus status = BatchWriteStatus::kSuccess;
	size_t groups_written = 0;
	size_t groups_failed = 0;
	size_t records_written = 0;

	bool ok() const { return status == BatchWriteStatus::kSuccess; }
};

class BatchWriter {
public:
	virtual ~BatchWriter() = default;

	// Persists every entry of |batch|. Never throws for per-entry problems.
	virtual BatchWriteResult WriteBatch(const std::vector<QueueEntry>& batch) = 0;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_PERSIST_BATCH_WRITER_H_
