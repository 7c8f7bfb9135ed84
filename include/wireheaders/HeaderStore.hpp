#ifndef WIRE_HEADERS_HEADER_STORE_HPP
#define WIRE_HEADERS_HEADER_STORE_HPP

#include "wireheaders/HeaderValue.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace wireheaders {

  // Values held for one header name: either a single value or an ordered list
  // of two or more. A list that drops to one member is demoted back to a single value.
  class HeaderEntry {
    public:
      explicit HeaderEntry(const std::string& name);

      const std::string& name() const { return name_; }

      size_t count() const;
      bool empty() const { return count() == 0; }
      bool isList() const { return !list_.empty(); }

      // Set when the entry holds exactly one value, nullptr otherwise.
      const wireheaders::HeaderValuePtr& single() const { return single_; }
      // Non-empty (two or more values) only when isList().
      const std::vector<wireheaders::HeaderValuePtr>& list() const { return list_; }

      std::vector<wireheaders::HeaderValuePtr> values() const;

      bool contains(const wireheaders::HeaderValue& value) const;
      void append(const wireheaders::HeaderValuePtr& value);
      bool remove(const wireheaders::HeaderValue& value);

    private:
      std::string name_;
      wireheaders::HeaderValuePtr single_;
      std::vector<wireheaders::HeaderValuePtr> list_;
  };

  /**
   * Header name to parsed values map owned by one request or response.
   *
   * Names are case-insensitive. Raw values go through the parser registered
   * for the name (see HeaderParsers) before they are stored.
   *
   * Not synchronized: populate it on one thread, share it read-only afterwards.
   */
  class HeaderStore {
    public:
      // Parses and appends. Throws std::invalid_argument on an invalid name or value.
      void add(const std::string& name, const std::string& value);

      // Parses and appends. Returns false and leaves the store unchanged on failure.
      bool tryAdd(const std::string& name, const std::string& value);

      bool remove(const std::string& name);
      bool contains(const std::string& name) const;
      bool containsParsedValue(const std::string& name, const wireheaders::HeaderValue& value) const;

      // nullptr when the header is absent.
      const HeaderEntry* getParsedValues(const std::string& name) const;

      void addParsedValue(const std::string& name, const wireheaders::HeaderValuePtr& value);
      bool removeParsedValue(const std::string& name, const wireheaders::HeaderValue& value);

      // Values joined by ", " in insertion order, empty when the header is absent.
      std::string getHeaderString(const std::string& name) const;
      // Same, skipping the first value equal to `exclude`.
      std::string getHeaderString(const std::string& name, const wireheaders::HeaderValue& exclude) const;

      std::vector<std::string> names() const;
      size_t size() const { return entries_.size(); }
      void clear() { entries_.clear(); }

    private:
      // Keyed by the lowercased name, the entry keeps the spelling first added.
      std::map<std::string, HeaderEntry> entries_;

      HeaderEntry& getOrCreateEntry(const std::string& name);
      const HeaderEntry* findEntry(const std::string& name) const;

      static void checkHeaderName(const std::string& name);
      static std::string join(const HeaderEntry& entry, const wireheaders::HeaderValue* exclude);
  };

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADER_STORE_HPP
