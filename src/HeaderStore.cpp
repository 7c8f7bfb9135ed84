#include "wireheaders/HeaderStore.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/HeaderParsers.hpp"
#include "wireheaders/Logs.hpp"
#include "wireheaders/Results.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace wireheaders {

  /* HeaderEntry */

  HeaderEntry::HeaderEntry(const std::string& name) : name_(name) {}

  size_t HeaderEntry::count() const {
    if (!this->list_.empty()) return this->list_.size();
    return this->single_ != nullptr ? 1 : 0;
  }

  std::vector<wireheaders::HeaderValuePtr> HeaderEntry::values() const {
    if (!this->list_.empty()) return this->list_;
    if (this->single_ != nullptr) return { this->single_ };
    return {};
  }

  bool HeaderEntry::contains(const wireheaders::HeaderValue& value) const {
    if (this->single_ != nullptr) return this->single_->equals(value);

    for (const auto& item : this->list_) {
      if (item->equals(value)) return true;
    }
    return false;
  }

  void HeaderEntry::append(const wireheaders::HeaderValuePtr& value) {
    if (this->single_ == nullptr && this->list_.empty()) {
      this->single_ = value;
      return;
    }

    // Second value promotes the single value to a list.
    if (this->single_ != nullptr) {
      this->list_.push_back(this->single_);
      this->single_ = nullptr;
    }
    this->list_.push_back(value);
  }

  bool HeaderEntry::remove(const wireheaders::HeaderValue& value) {
    if (this->single_ != nullptr) {
      if (!this->single_->equals(value)) return false;
      this->single_ = nullptr;
      return true;
    }

    for (auto it = this->list_.begin(); it != this->list_.end(); ++it) {
      if ((*it)->equals(value)) {
        this->list_.erase(it);

        if (this->list_.size() == 1) {
          this->single_ = this->list_.front();
          this->list_.clear();
        }
        return true;
      }
    }

    return false;
  }

  /* HeaderStore */

  void HeaderStore::add(const std::string& name, const std::string& value) {
    checkHeaderName(name);

    std::vector<wireheaders::HeaderValuePtr> values;
    if (!wireheaders::HeaderParsers::find(name)(value, values)) {
      wireheaders_error("[HeaderStore] Invalid value for header " << name << ": " << value);
      throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::INVALID_HEADER_VALUE) + ": " + name);
    }

    HeaderEntry& entry = this->getOrCreateEntry(name);
    for (const auto& item : values) {
      entry.append(item);
    }
  }

  bool HeaderStore::tryAdd(const std::string& name, const std::string& value) {
    if (!wireheaders::utils::isValidToken(name)) {
      wireheaders_log("[HeaderStore] tryAdd: invalid header name: " << name);
      return false;
    }

    std::vector<wireheaders::HeaderValuePtr> values;
    if (!wireheaders::HeaderParsers::find(name)(value, values)) {
      wireheaders_log("[HeaderStore] tryAdd: invalid value for header " << name << ": " << value);
      return false;
    }

    HeaderEntry& entry = this->getOrCreateEntry(name);
    for (const auto& item : values) {
      entry.append(item);
    }
    return true;
  }

  bool HeaderStore::remove(const std::string& name) {
    return this->entries_.erase(wireheaders::Buffer::toLower(name)) > 0;
  }

  bool HeaderStore::contains(const std::string& name) const {
    return this->findEntry(name) != nullptr;
  }

  bool HeaderStore::containsParsedValue(const std::string& name, const wireheaders::HeaderValue& value) const {
    const HeaderEntry* entry = this->findEntry(name);
    return entry != nullptr && entry->contains(value);
  }

  const HeaderEntry* HeaderStore::getParsedValues(const std::string& name) const {
    return this->findEntry(name);
  }

  void HeaderStore::addParsedValue(const std::string& name, const wireheaders::HeaderValuePtr& value) {
    checkHeaderName(name);
    if (value == nullptr) {
      throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::NULL_HEADER_VALUE));
    }

    this->getOrCreateEntry(name).append(value);
  }

  bool HeaderStore::removeParsedValue(const std::string& name, const wireheaders::HeaderValue& value) {
    const std::string key = wireheaders::Buffer::toLower(name);
    auto it = this->entries_.find(key);
    if (it == this->entries_.end()) return false;

    bool removed = it->second.remove(value);
    if (it->second.empty()) {
      this->entries_.erase(it);
    }
    return removed;
  }

  std::string HeaderStore::getHeaderString(const std::string& name) const {
    const HeaderEntry* entry = this->findEntry(name);
    if (entry == nullptr) return "";
    return join(*entry, nullptr);
  }

  std::string HeaderStore::getHeaderString(const std::string& name, const wireheaders::HeaderValue& exclude) const {
    const HeaderEntry* entry = this->findEntry(name);
    if (entry == nullptr) return "";
    return join(*entry, &exclude);
  }

  std::vector<std::string> HeaderStore::names() const {
    std::vector<std::string> result;
    for (const auto& [key, entry] : this->entries_) {
      result.push_back(entry.name());
    }
    return result;
  }

  /* Private Methods */

  HeaderEntry& HeaderStore::getOrCreateEntry(const std::string& name) {
    const std::string key = wireheaders::Buffer::toLower(name);
    auto it = this->entries_.find(key);
    if (it == this->entries_.end()) {
      it = this->entries_.emplace(key, HeaderEntry(name)).first;
    }
    return it->second;
  }

  const HeaderEntry* HeaderStore::findEntry(const std::string& name) const {
    auto it = this->entries_.find(wireheaders::Buffer::toLower(name));
    return it != this->entries_.end() ? &it->second : nullptr;
  }

  void HeaderStore::checkHeaderName(const std::string& name) {
    if (!wireheaders::utils::isValidToken(name)) {
      throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::INVALID_HEADER_NAME) + ": " + name);
    }
  }

  std::string HeaderStore::join(const HeaderEntry& entry, const wireheaders::HeaderValue* exclude) {
    std::string result;
    bool first = true;

    // Every value equal to exclude is skipped, not only the first one.
    for (const auto& value : entry.values()) {
      if (exclude != nullptr && value->equals(*exclude)) continue;

      if (!first) result += ", ";
      result += value->toString();
      first = false;
    }

    return result;
  }

} // namespace wireheaders
