#include "queue_entry.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace Pagestream {

std::string EntryId::ToString() const {
	return absl::StrCat(ms, "-", seq);
}

std::optional<EntryId> EntryId::Parse(absl::string_view text) {
	size_t dash = text.find('-');
	if (dash == absl::string_view::npos || dash == 0 || dash + 1 == text.size()) {
		return std::nullopt;
	}
	EntryId id;
	if (!absl::SimpleAtoi(text.substr(0, dash), &id.ms) ||
			!absl::SimpleAtoi(text.substr(dash + 1), &id.seq)) {
		return std::nullopt;
	}
	return id;
}

} // namespace Pagestream
