#include "log_queue.h"

#include <glog/logging.h>
#include <sys/stat.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <system_error>

#include "common/errors.h"

namespace Pagestream {

namespace {

constexpr uint32_t kRecordMagic = 0x50535131;  // "PSQ1"
constexpr uint8_t kRecordEntry = 1;
constexpr uint8_t kRecordAck = 2;
// Highest id issued so far; heads a compacted log so ids stay monotonic.
constexpr uint8_t kRecordMark = 3;
// magic(4) type(1) payload_len(4) checksum(4)
constexpr size_t kHeaderSize = 13;
constexpr uint32_t kMaxPayloadSize = 64u << 20;

// FNV-1a, enough to tell a torn tail from a complete record.
uint32_t Checksum(const char* data, size_t size) {
	uint32_t h = 2166136261u;
	for (size_t i = 0; i < size; ++i) {
		h ^= static_cast<uint8_t>(data[i]);
		h *= 16777619u;
	}
	return h;
}

template <typename T>
void Put(std::string& out, T value) {
	char buf[sizeof(T)];
	std::memcpy(buf, &value, sizeof(T));
	out.append(buf, sizeof(T));
}

void PutRecord(std::string& out, uint8_t type, const std::string& payload) {
	Put<uint32_t>(out, kRecordMagic);
	Put<uint8_t>(out, type);
	Put<uint32_t>(out, static_cast<uint32_t>(payload.size()));
	Put<uint32_t>(out, Checksum(payload.data(), payload.size()));
	out.append(payload);
}

void PutString(std::string& out, const std::string& s) {
	Put<uint32_t>(out, static_cast<uint32_t>(s.size()));
	out.append(s);
}

class Reader {
	public:
		Reader(const char* data, size_t size) : data_(data), size_(size) {}

		template <typename T>
		bool Get(T* value) {
			if (size_ - pos_ < sizeof(T)) return false;
			std::memcpy(value, data_ + pos_, sizeof(T));
			pos_ += sizeof(T);
			return true;
		}

		bool GetString(std::string* s) {
			uint32_t len;
			if (!Get(&len) || size_ - pos_ < len) return false;
			s->assign(data_ + pos_, len);
			pos_ += len;
			return true;
		}

		bool done() const { return pos_ == size_; }

	private:
		const char* data_;
		size_t size_;
		size_t pos_ = 0;
};

std::string EncodeEntry(const EntryId& id, const QueueFields& fields) {
	std::string out;
	Put<uint64_t>(out, id.ms);
	Put<uint64_t>(out, id.seq);
	Put<uint32_t>(out, static_cast<uint32_t>(fields.size()));
	for (const auto& [key, value] : fields) {
		PutString(out, key);
		PutString(out, value);
	}
	return out;
}

bool DecodeEntry(const std::string& payload, EntryId* id, QueueFields* fields) {
	Reader r(payload.data(), payload.size());
	uint32_t count;
	if (!r.Get(&id->ms) || !r.Get(&id->seq) || !r.Get(&count)) return false;
	for (uint32_t i = 0; i < count; ++i) {
		std::string key, value;
		if (!r.GetString(&key) || !r.GetString(&value)) return false;
		(*fields)[std::move(key)] = std::move(value);
	}
	return r.done();
}

std::string EncodeAck(const std::vector<EntryId>& ids) {
	std::string out;
	Put<uint32_t>(out, static_cast<uint32_t>(ids.size()));
	for (const EntryId& id : ids) {
		Put<uint64_t>(out, id.ms);
		Put<uint64_t>(out, id.seq);
	}
	return out;
}

bool DecodeAck(const std::string& payload, std::vector<EntryId>* ids) {
	Reader r(payload.data(), payload.size());
	uint32_t count;
	if (!r.Get(&count)) return false;
	for (uint32_t i = 0; i < count; ++i) {
		EntryId id;
		if (!r.Get(&id.ms) || !r.Get(&id.seq)) return false;
		ids->push_back(id);
	}
	return r.done();
}

std::string EncodeMark(const EntryId& id) {
	std::string out;
	Put<uint64_t>(out, id.ms);
	Put<uint64_t>(out, id.seq);
	return out;
}

bool DecodeMark(const std::string& payload, EntryId* id) {
	Reader r(payload.data(), payload.size());
	return r.Get(&id->ms) && r.Get(&id->seq) && r.done();
}

// Makes a rename inside the directory of |path| durable.
void SyncParentDirectory(const std::string& path) {
	std::filesystem::path parent = std::filesystem::path(path).parent_path();
	const std::string dir = parent.empty() ? "." : parent.string();
	ScopedFd fd = OpenOrThrow(dir, O_RDONLY | O_DIRECTORY);
	FsyncOrThrow(fd.get(), dir);
}

// Reads up to |size| bytes at |offset|; returns the count actually read.
size_t ReadAt(int fd, uint64_t offset, char* buf, size_t size, const std::string& what) {
	size_t total = 0;
	while (total < size) {
		ssize_t n = ::pread(fd, buf + total, size - total, static_cast<off_t>(offset + total));
		if (n < 0) {
			if (errno == EINTR) continue;
			throw std::system_error(errno, std::generic_category(), "read failed for " + what);
		}
		if (n == 0) break;
		total += static_cast<size_t>(n);
	}
	return total;
}

} // namespace

LogQueue::LogQueue(Options options) : options_(std::move(options)) {
	if (!in_memory()) {
		std::filesystem::path parent = std::filesystem::path(options_.log_path).parent_path();
		if (!parent.empty()) {
			std::error_code ec;
			std::filesystem::create_directories(parent, ec);
			if (ec) {
				throw std::system_error(ec, "cannot create queue directory " + parent.string());
			}
		}
		absl::MutexLock lock(&mu_);
		fd_ = OpenOrThrow(options_.log_path, O_RDWR | O_CREAT | O_APPEND);
		if (Recover()) {
			CompactLocked();
		}
	}
	if (!in_memory() && options_.fsync_interval > absl::ZeroDuration()) {
		fsync_thread_ = std::thread(&LogQueue::FsyncLoop, this);
	}
	absl::MutexLock lock(&mu_);
	LOG(INFO) << "Queue group " << options_.group << " opened"
		<< (in_memory() ? " in memory" : " at " + options_.log_path)
		<< ", " << entries_.size() << " unacknowledged entries";
}

LogQueue::~LogQueue() {
	shutdown_.Notify();
	if (fsync_thread_.joinable()) {
		fsync_thread_.join();
	}
	absl::MutexLock lock(&mu_);
	if (fd_.valid() && dirty_ && ::fsync(fd_.get()) != 0) {
		LOG(ERROR) << "Final fsync of " << options_.log_path << " failed: " << strerror(errno);
	}
}

bool LogQueue::Recover() {
	struct stat st;
	if (::fstat(fd_.get(), &st) != 0) {
		throw std::system_error(errno, std::generic_category(), "stat failed for " + options_.log_path);
	}
	const uint64_t file_size = static_cast<uint64_t>(st.st_size);

	uint64_t offset = 0;
	uint64_t records = 0;
	uint64_t acks = 0;
	std::string payload;
	while (offset < file_size) {
		char header[kHeaderSize];
		if (ReadAt(fd_.get(), offset, header, kHeaderSize, options_.log_path) != kHeaderSize) break;

		uint32_t magic, len, checksum;
		uint8_t type;
		std::memcpy(&magic, header, 4);
		std::memcpy(&type, header + 4, 1);
		std::memcpy(&len, header + 5, 4);
		std::memcpy(&checksum, header + 9, 4);
		if (magic != kRecordMagic || len > kMaxPayloadSize) break;

		payload.resize(len);
		if (ReadAt(fd_.get(), offset + kHeaderSize, payload.data(), len, options_.log_path) != len) break;
		if (Checksum(payload.data(), len) != checksum) break;

		if (type == kRecordEntry) {
			EntryId id;
			QueueFields fields;
			if (!DecodeEntry(payload, &id, &fields)) break;
			entries_[id] = std::move(fields);
			if (last_id_ < id) last_id_ = id;
			++length_;
		} else if (type == kRecordAck) {
			std::vector<EntryId> ids;
			if (!DecodeAck(payload, &ids)) break;
			for (const EntryId& id : ids) {
				entries_.erase(id);
			}
			++acks;
		} else if (type == kRecordMark) {
			EntryId id;
			if (!DecodeMark(payload, &id)) break;
			if (last_id_ < id) last_id_ = id;
		} else {
			break;
		}
		offset += kHeaderSize + len;
		++records;
	}

	if (offset < file_size) {
		LOG(WARNING) << "Queue log " << options_.log_path << " has " << (file_size - offset)
			<< " unreadable bytes after offset " << offset << ", truncating";
		if (::ftruncate(fd_.get(), static_cast<off_t>(offset)) != 0) {
			throw std::system_error(errno, std::generic_category(), "truncate failed for " + options_.log_path);
		}
	}
	log_size_ = offset;
	VLOG(1) << "Replayed " << records << " records from " << options_.log_path;
	return acks > 0;
}

void LogQueue::CompactLocked() {
	const std::string tmp_path = options_.log_path + ".compact";
	std::string contents;
	PutRecord(contents, kRecordMark, EncodeMark(last_id_));
	for (const auto& [id, fields] : entries_) {
		PutRecord(contents, kRecordEntry, EncodeEntry(id, fields));
	}

	try {
		ScopedFd tmp = OpenOrThrow(tmp_path, O_RDWR | O_CREAT | O_TRUNC | O_APPEND);
		WriteAllOrThrow(tmp.get(), contents.data(), contents.size(), tmp_path);
		FsyncOrThrow(tmp.get(), tmp_path);
		if (::rename(tmp_path.c_str(), options_.log_path.c_str()) != 0) {
			throw std::system_error(errno, std::generic_category(), "rename failed for " + tmp_path);
		}
		fd_ = std::move(tmp);
	} catch (const std::system_error& e) {
		// The old log is still complete; keep appending to it.
		LOG(WARNING) << "Compaction of " << options_.log_path << " skipped: " << e.what();
		::unlink(tmp_path.c_str());
		return;
	}

	const uint64_t old_size = log_size_;
	log_size_ = contents.size();
	length_ = entries_.size();
	dirty_ = false;
	try {
		SyncParentDirectory(options_.log_path);
	} catch (const std::system_error& e) {
		// A crash may bring back the uncompacted log, which replays to the same state.
		LOG(WARNING) << "Directory sync after compaction failed: " << e.what();
	}
	LOG(INFO) << "Compacted " << options_.log_path << " from " << old_size << " to " << log_size_
		<< " bytes, " << entries_.size() << " unacknowledged entries kept";
}

void LogQueue::AppendLocked(uint8_t type, const std::string& payload) {
	if (broken_) {
		throw TransientStoreError("queue log " + options_.log_path + " is unusable after a failed append");
	}
	std::string record;
	record.reserve(kHeaderSize + payload.size());
	PutRecord(record, type, payload);

	try {
		WriteAllOrThrow(fd_.get(), record.data(), record.size(), options_.log_path);
		if (options_.fsync_interval <= absl::ZeroDuration()) {
			FsyncOrThrow(fd_.get(), options_.log_path);
		} else {
			dirty_ = true;
		}
	} catch (const std::system_error& e) {
		LOG(ERROR) << "Queue append failed: " << e.what();
		// Drop whatever part of the record reached the file.
		if (::ftruncate(fd_.get(), static_cast<off_t>(log_size_)) != 0) {
			LOG(ERROR) << "Rollback of " << options_.log_path << " failed: " << strerror(errno);
			broken_ = true;
		}
		throw TransientStoreError(std::string("queue append failed: ") + e.what());
	}
	log_size_ += record.size();
}

EntryId LogQueue::NextIdLocked(absl::Time now) const {
	int64_t now_ms = absl::ToUnixMillis(now);
	EntryId id;
	if (now_ms > 0 && static_cast<uint64_t>(now_ms) > last_id_.ms) {
		id.ms = static_cast<uint64_t>(now_ms);
		id.seq = 0;
	} else {
		id.ms = last_id_.ms;
		id.seq = last_id_.seq + 1;
	}
	return id;
}

EntryId LogQueue::Enqueue(const QueueFields& fields) {
	absl::MutexLock lock(&mu_);
	EntryId id = NextIdLocked(options_.clock());
	if (!in_memory()) {
		AppendLocked(kRecordEntry, EncodeEntry(id, fields));
	}
	entries_.emplace(id, fields);
	last_id_ = id;
	++length_;
	return id;
}

bool LogQueue::HasUndeliveredLocked() const {
	return entries_.upper_bound(last_delivered_) != entries_.end();
}

void LogQueue::CollectLocked(const std::string& consumer, size_t max_count, absl::Time now,
		std::vector<QueueEntry>& out) {
	// Entries whose lease ran out go first, oldest id first.
	for (auto& [id, pending] : pending_) {
		if (out.size() >= max_count) return;
		if (now - pending.delivered_at < options_.lease_timeout) continue;
		auto entry = entries_.find(id);
		if (entry == entries_.end()) continue;
		VLOG(2) << "Redelivering " << id.ToString() << " from " << pending.consumer << " to " << consumer;
		pending.consumer = consumer;
		pending.delivered_at = now;
		++pending.delivery_count;
		out.push_back(QueueEntry{id, entry->second, id.Timestamp(), pending.delivery_count});
	}

	for (auto it = entries_.upper_bound(last_delivered_);
			it != entries_.end() && out.size() < max_count; ++it) {
		PendingEntry& pending = pending_[it->first];
		pending.consumer = consumer;
		pending.delivered_at = now;
		pending.delivery_count = 1;
		out.push_back(QueueEntry{it->first, it->second, it->first.Timestamp(), 1});
		last_delivered_ = it->first;
	}
}

std::vector<QueueEntry> LogQueue::Claim(const std::string& consumer,
		size_t max_count, absl::Duration max_wait) {
	std::vector<QueueEntry> out;
	if (max_count == 0) {
		return out;
	}
	absl::MutexLock lock(&mu_);
	if (broken_) {
		throw TransientStoreError("queue log " + options_.log_path + " is unusable after a failed append");
	}
	CollectLocked(consumer, max_count, options_.clock(), out);
	if (out.empty() && max_wait > absl::ZeroDuration()) {
		if (mu_.AwaitWithTimeout(absl::Condition(this, &LogQueue::HasUndeliveredLocked), max_wait)) {
			CollectLocked(consumer, max_count, options_.clock(), out);
		}
	}
	return out;
}

size_t LogQueue::Acknowledge(const std::vector<EntryId>& ids) {
	absl::MutexLock lock(&mu_);
	std::vector<EntryId> acked;
	acked.reserve(ids.size());
	for (const EntryId& id : ids) {
		if (pending_.count(id) != 0) {
			acked.push_back(id);
		}
	}
	if (acked.empty()) {
		return 0;
	}
	if (!in_memory()) {
		AppendLocked(kRecordAck, EncodeAck(acked));
	}
	for (const EntryId& id : acked) {
		pending_.erase(id);
		entries_.erase(id);
	}
	if (!in_memory() && options_.compact_threshold_bytes > 0 &&
			log_size_ >= options_.compact_threshold_bytes &&
			entries_.size() <= kQueueCompactMaxLiveEntries) {
		CompactLocked();
	}
	return acked.size();
}

QueueStats LogQueue::Stats() const {
	absl::MutexLock lock(&mu_);
	QueueStats stats;
	stats.length = length_;
	stats.pending = pending_.size();
	stats.backlog = static_cast<uint64_t>(
			std::distance(entries_.upper_bound(last_delivered_), entries_.end()));
	return stats;
}

void LogQueue::FsyncLoop() {
	VLOG(1) << "Queue fsync thread started.";
	while (!shutdown_.WaitForNotificationWithTimeout(options_.fsync_interval)) {
		absl::MutexLock lock(&mu_);
		if (!dirty_ || !fd_.valid()) continue;
		if (::fsync(fd_.get()) != 0) {
			LOG(ERROR) << "fsync failed for " << options_.log_path << ": " << strerror(errno);
			continue;
		}
		dirty_ = false;
	}
	VLOG(1) << "Queue fsync thread exiting.";
}

} // namespace Pagestream
