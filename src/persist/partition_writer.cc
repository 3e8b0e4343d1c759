#include "partition_writer.h"

#include <glog/logging.h>
#include <sys/stat.h>

#include <filesystem>
#include <system_error>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_format.h"
#include "common/errors.h"
#include "common/scoped_fd.h"
#include "event/page_view_event.h"

namespace Pagestream {

namespace {

std::string FieldOrEmpty(const QueueFields& fields, const char* name) {
	auto it = fields.find(name);
	return it == fields.end() ? std::string() : it->second;
}

// Malformed or non-object payloads are stored as null.
nlohmann::ordered_json DecodePayload(const std::string& text) {
	if (text.empty()) {
		return nullptr;
	}
	nlohmann::ordered_json payload = nlohmann::ordered_json::parse(text, nullptr, false);
	if (payload.is_discarded() || !payload.is_object()) {
		VLOG(2) << "Unreadable payload stored as null: " << text;
		return nullptr;
	}
	return payload;
}

} // namespace

PartitionWriter::PartitionWriter(std::string root_dir, Clock clock)
	: root_dir_(std::move(root_dir)), clock_(std::move(clock)) {}

void PartitionWriter::EnsureRoot() const {
	std::error_code ec;
	std::filesystem::create_directories(root_dir_, ec);
	if (ec || !std::filesystem::is_directory(root_dir_, ec)) {
		throw FatalConfigError("cannot create storage root " + root_dir_ +
				(ec ? ": " + ec.message() : std::string()));
	}
	LOG(INFO) << "Partition files under " << root_dir_;
}

std::string PartitionWriter::PartitionName(absl::CivilHour hour) {
	return absl::StrFormat("%04d-%02d-%02d-%02d", hour.year(), hour.month(), hour.day(), hour.hour());
}

std::string PartitionWriter::RelativePartitionPath(absl::CivilHour hour) {
	return absl::StrFormat("%04d/%02d/%02d/events_%s.jsonl", hour.year(), hour.month(), hour.day(),
			PartitionName(hour));
}

PartitionWriter::Record PartitionWriter::BuildRecord(const QueueEntry& entry, absl::Time processed_at) {
	const QueueFields& fields = entry.fields;
	const std::string timestamp = FieldOrEmpty(fields, kFieldTimestamp);
	const std::string enqueued_at = FieldOrEmpty(fields, kFieldEnqueuedAt);

	bool parse_error = false;
	absl::Time event_time;
	if (auto ts = ParseTimestamp(timestamp)) {
		event_time = *ts;
	} else {
		parse_error = true;
		if (auto fallback = ParseTimestamp(enqueued_at)) {
			event_time = *fallback;
		} else {
			event_time = processed_at;
		}
		LOG(WARNING) << "Entry " << entry.id.ToString() << " has unparseable timestamp '"
			<< timestamp << "', partitioned by " << FormatTimestamp(event_time);
	}

	Record record;
	record.hour = absl::ToCivilHour(event_time, absl::UTCTimeZone());
	nlohmann::ordered_json& j = record.json;
	j["queue_entry_id"] = entry.id.ToString();
	j["processed_at"] = FormatTimestamp(processed_at);
	j["event_id"] = FieldOrEmpty(fields, kFieldEventId);
	j["user_id"] = FieldOrEmpty(fields, kFieldUserId);
	j["timestamp"] = timestamp;
	j["event_type"] = FieldOrEmpty(fields, kFieldEventType);
	j["enqueued_at"] = enqueued_at.empty() ? FormatTimestamp(entry.enqueued_at) : enqueued_at;
	j["payload"] = DecodePayload(FieldOrEmpty(fields, kFieldPayload));
	if (parse_error) {
		j["timestamp_parse_error"] = true;
	}
	return record;
}

BatchWriteResult PartitionWriter::WriteBatch(const std::vector<QueueEntry>& batch) {
	BatchWriteResult result;
	if (batch.empty()) {
		return result;
	}

	const absl::Time processed_at = clock_();
	// Groups in order of first appearance; lines keep arrival order.
	struct Group {
		absl::CivilHour hour;
		std::string lines;
		size_t records = 0;
	};
	std::vector<Group> groups;
	absl::flat_hash_map<std::string, size_t> index;
	for (const QueueEntry& entry : batch) {
		Record record = BuildRecord(entry, processed_at);
		auto [it, inserted] = index.try_emplace(PartitionName(record.hour), groups.size());
		if (inserted) {
			groups.push_back(Group{record.hour, std::string(), 0});
		}
		Group& group = groups[it->second];
		group.lines += record.json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
		group.lines += '\n';
		++group.records;
	}

	for (const Group& group : groups) {
		try {
			AppendGroup(group.hour, group.lines);
			++result.groups_written;
			result.records_written += group.records;
			VLOG(2) << "Wrote " << group.records << " records to partition " << PartitionName(group.hour);
		} catch (const std::exception& e) {
			++result.groups_failed;
			LOG(ERROR) << "Failed to write partition " << PartitionName(group.hour) << ": " << e.what();
		}
	}

	if (result.groups_failed > 0) {
		result.status = BatchWriteStatus::kPartialFailure;
	}
	return result;
}

void PartitionWriter::AppendGroup(absl::CivilHour hour, const std::string& lines) const {
	const std::filesystem::path path = std::filesystem::path(root_dir_) / RelativePartitionPath(hour);
	std::filesystem::create_directories(path.parent_path());

	const std::string what = path.string();
	ScopedFd fd = OpenOrThrow(what, O_WRONLY | O_APPEND | O_CREAT);
	struct stat st;
	if (::fstat(fd.get(), &st) != 0) {
		throw std::system_error(errno, std::generic_category(), "stat failed for " + what);
	}
	try {
		WriteAllOrThrow(fd.get(), lines.data(), lines.size(), what);
		FsyncOrThrow(fd.get(), what);
	} catch (const std::system_error&) {
		if (::ftruncate(fd.get(), st.st_size) != 0) {
			LOG(ERROR) << "Could not roll back " << what << ", partial lines may remain";
		}
		throw;
	}
	fd.CloseOrThrow(what);
}

} // namespace Pagestream
