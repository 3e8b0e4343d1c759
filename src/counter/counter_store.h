#ifndef PAGESTREAM_SRC_COUNTER_COUNTER_STORE_H_
#define PAGESTREAM_SRC_COUNTER_COUNTER_STORE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/time/time.h"

namespace Pagestream {

/**
 * Key/value store holding expiring counters and expiring sets.
 *
 * Each mutation is atomic with respect to the key it touches. A key whose
 * expiry has passed reads as absent. Implementations throw
 * TransientStoreError when the store cannot be reached.
 */
class CounterStore {
public:
	virtual ~CounterStore() = default;

	// Creates |key| at 1 expiring after |ttl|, or adds 1 and leaves the
	// expiry alone. Returns the new value.
	virtual int64_t IncrementWithExpiry(const std::string& key, absl::Duration ttl) = 0;

	// Adds |member| to the set at |key|. |ttl| applies only when this call
	// creates the set. Returns true if |member| was not already present.
	virtual bool AddMemberWithExpiry(const std::string& key, const std::string& member,
			absl::Duration ttl) = 0;

	virtual int64_t GetCount(const std::string& key) const = 0;
	virtual std::vector<std::string> GetMembers(const std::string& key) const = 0;
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COUNTER_COUNTER_STORE_H_
