#ifndef CONDUIT_HTTP_HEADERS_H
#define CONDUIT_HTTP_HEADERS_H

#include <string>
#include <utility>
#include <vector>

#include "conduit/core/compat.h"

namespace conduit {
namespace http {

using HeaderPair = std::pair<std::string, std::string>;

// Header fields in wire order, names as received
using HeaderPairs = std::vector<HeaderPair>;

// A header seen once keeps a single value; a repeated one becomes a list
using HeaderValue = variant<std::string, std::vector<std::string>>;

/**
 * Response header map handed to callers.
 *
 * Keys keep their received spelling and are matched exactly, so
 * "Set-Cookie" and "set-cookie" are distinct entries. Iteration follows
 * first-occurrence order.
 */
class HeaderMap {
 public:
  using Entry = std::pair<std::string, HeaderValue>;
  using const_iterator = std::vector<Entry>::const_iterator;

  // Applies the fold rule for one received field
  void append(const std::string& key, const std::string& value);

  const HeaderValue* find(const std::string& key) const;

  bool contains(const std::string& key) const { return find(key) != nullptr; }

  // First value received for |key|
  optional<std::string> first(const std::string& key) const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
};

HeaderMap foldHeaders(const HeaderPairs& pairs);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HEADERS_H
