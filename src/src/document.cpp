#include <sp/document.h>
#include <sp/errors.h>
#include <utility>

namespace sp {

const Entry* Document::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

void DocumentBuilder::add(Entry entry) {
    auto it = doc_.index_.find(entry.key);
    if (it == doc_.index_.end()) {
        doc_.index_.emplace(entry.key, doc_.entries_.size());
        doc_.entries_.push_back(std::move(entry));
        return;
    }

    Entry& existing = doc_.entries_[it->second];
    if (policy_ == DuplicateKeyPolicy::Reject) {
        throw DuplicateKeyFault(entry.key, existing.line, entry.line);
    }
    existing.value = std::move(entry.value);
    existing.line = entry.line;
}

Document DocumentBuilder::finish() {
    Document out = std::move(doc_);
    doc_ = Document();
    return out;
}

Document build_document(const std::vector<Entry>& entries, DuplicateKeyPolicy policy) {
    DocumentBuilder builder(policy);
    for (auto const& e : entries) builder.add(e);
    return builder.finish();
}

}  // namespace sp
