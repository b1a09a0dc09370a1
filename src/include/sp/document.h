#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include <sp/entry.h>

namespace sp {

enum class DuplicateKeyPolicy {
    Reject,   // a repeated key throws DuplicateKeyFault
    LastWins  // a repeated key replaces the earlier value, keeping its position
};

struct ParseOptions {
    DuplicateKeyPolicy duplicates = DuplicateKeyPolicy::Reject;
};

// Entries in file order. The key index is kept beside the vector so lookups
// and uniqueness checks never depend on map ordering. Only DocumentBuilder
// creates non-empty documents.
class Document {
public:
    using const_iterator = std::vector<Entry>::const_iterator;

    Document() = default;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const Entry& operator[](size_t i) const { return entries_[i]; }
    const Entry& at(size_t i) const { return entries_.at(i); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    const std::vector<Entry>& entries() const { return entries_; }

    bool has(const std::string& key) const { return index_.count(key) != 0; }

    // nullptr when the key is absent
    const Entry* find(const std::string& key) const;

private:
    friend class DocumentBuilder;

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

class DocumentBuilder {
public:
    explicit DocumentBuilder(DuplicateKeyPolicy policy = DuplicateKeyPolicy::Reject) : policy_(policy) {}

    void add(Entry entry);

    // Hands over the assembled document; the builder is left empty.
    Document finish();

private:
    DuplicateKeyPolicy policy_;
    Document doc_;
};

Document build_document(const std::vector<Entry>& entries,
                        DuplicateKeyPolicy policy = DuplicateKeyPolicy::Reject);

}  // namespace sp
