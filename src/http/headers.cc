#include "conduit/http/headers.h"

namespace conduit {
namespace http {

void HeaderMap::append(const std::string& key, const std::string& value) {
  for (auto& entry : entries_) {
    if (entry.first != key) {
      continue;
    }
    if (auto* single = get_if<std::string>(&entry.second)) {
      std::vector<std::string> values{*single, value};
      entry.second = std::move(values);
    } else {
      get<std::vector<std::string>>(entry.second).push_back(value);
    }
    return;
  }
  entries_.emplace_back(key, HeaderValue(value));
}

const HeaderValue* HeaderMap::find(const std::string& key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

optional<std::string> HeaderMap::first(const std::string& key) const {
  const HeaderValue* value = find(key);
  if (!value) {
    return nullopt;
  }
  if (const auto* single = get_if<std::string>(value)) {
    return *single;
  }
  return get<std::vector<std::string>>(*value).front();
}

HeaderMap foldHeaders(const HeaderPairs& pairs) {
  HeaderMap map;
  for (const auto& pair : pairs) {
    map.append(pair.first, pair.second);
  }
  return map;
}

}  // namespace http
}  // namespace conduit
