#ifndef WIRE_HEADERS_HEADER_VALUE_COLLECTION_HPP
#define WIRE_HEADERS_HEADER_VALUE_COLLECTION_HPP

#include "wireheaders/HeaderStore.hpp"
#include "wireheaders/HeaderValue.hpp"
#include "wireheaders/Results.hpp"
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wireheaders {

  /**
   * Collection-like view over the values of one header in a HeaderStore.
   *
   * The view holds no values itself: every call reads or writes the store, so
   * count() and iteration always reflect the current entry. Changing the entry
   * while an iteration is in progress is not detected; the iterator keeps
   * walking the values that were stored when begin() was called.
   *
   * Some headers are lists for which the RFC defines one well-known member
   * (Connection: close, Transfer-Encoding: chunked, Expect: 100-continue).
   * A view configured with that "special value" exposes it as a flag through
   * isSpecialValueSet(), setSpecialValue() and removeSpecialValue(). The flag
   * is computed from the list on every read, so the two never disagree.
   */
  template <typename T>
  class HeaderValueCollection {
    public:
      typedef std::shared_ptr<T> ValuePtr;
      typedef std::function<void(const HeaderValueCollection<T>& collection, const ValuePtr& value)> Validator;

      class Iterator {
        public:
          using iterator_category = std::input_iterator_tag;
          using value_type = ValuePtr;
          using difference_type = std::ptrdiff_t;
          using pointer = const ValuePtr*;
          using reference = ValuePtr;

          Iterator() : index_(0) {}
          explicit Iterator(std::shared_ptr<const std::vector<wireheaders::HeaderValuePtr>> values)
            : values_(std::move(values)), index_(0) {}

          ValuePtr operator*() const { return cast((*values_)[index_]); }

          Iterator& operator++() {
            ++index_;
            return *this;
          }

          Iterator operator++(int) {
            Iterator previous = *this;
            ++index_;
            return previous;
          }

          bool operator==(const Iterator& other) const {
            if (atEnd() || other.atEnd()) return atEnd() == other.atEnd();
            return values_ == other.values_ && index_ == other.index_;
          }

          bool operator!=(const Iterator& other) const { return !(*this == other); }

        private:
          std::shared_ptr<const std::vector<wireheaders::HeaderValuePtr>> values_;
          size_t index_;

          bool atEnd() const { return values_ == nullptr || index_ >= values_->size(); }
      };

      HeaderValueCollection(const std::string& headerName, wireheaders::HeaderStore& store)
        : HeaderValueCollection(headerName, store, nullptr, nullptr) {}

      HeaderValueCollection(const std::string& headerName, wireheaders::HeaderStore& store, Validator validator)
        : HeaderValueCollection(headerName, store, nullptr, std::move(validator)) {}

      HeaderValueCollection(const std::string& headerName, wireheaders::HeaderStore& store, ValuePtr specialValue)
        : HeaderValueCollection(headerName, store, std::move(specialValue), nullptr) {}

      HeaderValueCollection(const std::string& headerName, wireheaders::HeaderStore& store, ValuePtr specialValue, Validator validator)
        : headerName_(headerName), store_(&store), specialValue_(std::move(specialValue)), validator_(std::move(validator)) {}

      const std::string& headerName() const { return headerName_; }
      bool isReadOnly() const { return false; }

      // Recomputed from the store on every call.
      size_t count() const {
        const wireheaders::HeaderEntry* entry = store_->getParsedValues(headerName_);
        return entry == nullptr ? 0 : entry->count();
      }

      void add(const ValuePtr& item) {
        checkValue(item);
        store_->addParsedValue(headerName_, item);
      }

      // Wire-format text, throws std::invalid_argument when it does not parse.
      void parseAdd(const std::string& input) {
        store_->add(headerName_, input);
      }

      bool tryParseAdd(const std::string& input) {
        return store_->tryAdd(headerName_, input);
      }

      void clear() {
        store_->remove(headerName_);
      }

      bool contains(const ValuePtr& item) const {
        checkValue(item);
        return store_->containsParsedValue(headerName_, *item);
      }

      bool remove(const ValuePtr& item) {
        checkValue(item);
        return store_->removeParsedValue(headerName_, *item);
      }

      // Copies count() values into (*array)[arrayIndex...]. arrayIndex may equal
      // array->size() only when there is nothing to copy.
      void copyTo(std::vector<ValuePtr>* array, std::ptrdiff_t arrayIndex) const {
        if (array == nullptr) {
          throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::COPY_DESTINATION_NULL));
        }
        if (arrayIndex < 0 || static_cast<size_t>(arrayIndex) > array->size()) {
          throw std::out_of_range(wireheaders::getErrorMessage(HeaderResult::COPY_INDEX_OUT_OF_RANGE));
        }

        const wireheaders::HeaderEntry* entry = store_->getParsedValues(headerName_);
        if (entry == nullptr) {
          return;
        }

        const size_t index = static_cast<size_t>(arrayIndex);
        if (entry->count() > array->size() - index) {
          throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::COPY_DESTINATION_TOO_SMALL));
        }

        size_t position = index;
        for (const auto& value : entry->values()) {
          (*array)[position++] = cast(value);
        }
      }

      Iterator begin() const {
        const wireheaders::HeaderEntry* entry = store_->getParsedValues(headerName_);
        if (entry == nullptr) return Iterator();
        return Iterator(std::make_shared<const std::vector<wireheaders::HeaderValuePtr>>(entry->values()));
      }

      Iterator end() const {
        return Iterator();
      }

      std::string toString() const {
        return store_->getHeaderString(headerName_);
      }

      bool isSpecialValueSet() const {
        if (specialValue_ == nullptr) {
          return false;
        }
        return store_->containsParsedValue(headerName_, *specialValue_);
      }

      void setSpecialValue() {
        checkSpecialValue();
        if (!store_->containsParsedValue(headerName_, *specialValue_)) {
          store_->addParsedValue(headerName_, specialValue_);
        }
      }

      void removeSpecialValue() {
        checkSpecialValue();
        // The wire text may carry the member more than once; drop all of them.
        while (store_->removeParsedValue(headerName_, *specialValue_)) {}
      }

      // Wire text without the special value, which the owner renders from its flag.
      std::string getHeaderStringWithoutSpecial() const {
        if (!isSpecialValueSet()) {
          return toString();
        }
        return store_->getHeaderString(headerName_, *specialValue_);
      }

    private:
      std::string headerName_;
      wireheaders::HeaderStore* store_;
      ValuePtr specialValue_;
      Validator validator_;

      void checkValue(const ValuePtr& item) const {
        if (item == nullptr) {
          throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::NULL_HEADER_VALUE));
        }

        if (validator_) {
          validator_(*this, item);
        }
      }

      void checkSpecialValue() const {
        if (specialValue_ == nullptr) {
          throw std::logic_error(wireheaders::getErrorMessage(HeaderResult::SPECIAL_VALUE_NOT_CONFIGURED) + ": " + headerName_);
        }
      }

      static ValuePtr cast(const wireheaders::HeaderValuePtr& value) {
        ValuePtr typed = std::dynamic_pointer_cast<T>(value);
        if (typed == nullptr) {
          throw std::logic_error(wireheaders::getErrorMessage(HeaderResult::HEADER_VALUE_TYPE_MISMATCH));
        }
        return typed;
      }
  };

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADER_VALUE_COLLECTION_HPP
