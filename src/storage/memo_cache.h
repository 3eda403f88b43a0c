// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


#ifndef ROMANTOOLS_STORAGE_MEMO_CACHE_H_
#define ROMANTOOLS_STORAGE_MEMO_CACHE_H_

#include <cstddef>
#include <list>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/synchronization/mutex.h"

namespace romantools {
namespace storage {

// Fixed-capacity memoization table. Once `max_elements` entries are stored,
// inserting a new key replaces the least recently used entry.
//
// All methods are thread-safe. Values are returned by copy so that a result
// stays valid while other threads keep inserting.
template <typename Key, typename Value>
class MemoCache {
 public:
  explicit MemoCache(size_t max_elements) : max_elements_(max_elements) {
    CHECK_GT(max_elements_, 0);
  }

  MemoCache(const MemoCache &) = delete;
  MemoCache &operator=(const MemoCache &) = delete;

  // Returns the cached value and marks the entry as most recently used.
  std::optional<Value> Lookup(const Key &key) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++misses_;
      return std::nullopt;
    }
    ++hits_;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  // Adds or overwrites the value for `key`.
  void Insert(const Key &key, Value value) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    if (auto it = index_.find(key); it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }
    if (entries_.size() >= max_elements_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();
  }

  bool HasKey(const Key &key) const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return index_.contains(key);
  }

  void Clear() ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    index_.clear();
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
  }

  size_t Size() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return entries_.size();
  }

  size_t capacity() const { return max_elements_; }

  size_t hits() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return hits_;
  }

  size_t misses() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return misses_;
  }

  // Keys from the most recently used to the least recently used.
  std::vector<Key> KeysForTesting() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    std::vector<Key> keys;
    keys.reserve(entries_.size());
    for (const auto &[key, unused_value] : entries_) {
      keys.push_back(key);
    }
    return keys;
  }

 private:
  using EntryList = std::list<std::pair<Key, Value>>;

  const size_t max_elements_;
  mutable absl::Mutex mutex_;
  EntryList entries_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<Key, typename EntryList::iterator> index_
      ABSL_GUARDED_BY(mutex_);
  size_t hits_ ABSL_GUARDED_BY(mutex_) = 0;
  size_t misses_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace storage
}  // namespace romantools

#endif  // ROMANTOOLS_STORAGE_MEMO_CACHE_H_
