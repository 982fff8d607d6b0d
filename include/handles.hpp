#pragma once

#include "host_api.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace modkit {

// Refcounted owner of a host string. Copies retain, destruction frees.
class ModuleString {
 public:
  ModuleString() = default;
  ModuleString(HostApi* api, HostContext* ctx, std::string_view bytes);
  ModuleString(const ModuleString& other);
  ModuleString(ModuleString&& other) noexcept;
  ModuleString& operator=(const ModuleString& other);
  ModuleString& operator=(ModuleString&& other) noexcept;
  ~ModuleString();

  // Takes over a reference the host handed out.
  static ModuleString adopt(HostApi* api, HostContext* ctx, HostString* raw);

  HostString* raw() const { return raw_; }
  bool is_null() const { return raw_ == nullptr; }
  std::string_view bytes() const;
  std::string str() const { return std::string(bytes()); }

 private:
  void release();

  HostApi* api_ = nullptr;
  HostContext* ctx_ = nullptr;
  HostString* raw_ = nullptr;
};

// Owner of a root call reply.
class CallReply {
 public:
  CallReply(HostApi* api, HostCallReply* raw) : api_(api), raw_(raw) {}
  CallReply(CallReply&& other) noexcept;
  CallReply& operator=(CallReply&& other) noexcept;
  CallReply(const CallReply&) = delete;
  CallReply& operator=(const CallReply&) = delete;
  ~CallReply();

  HostCallReply* get() const { return raw_; }
  bool is_null() const { return raw_ == nullptr; }

 private:
  HostApi* api_ = nullptr;
  HostCallReply* raw_ = nullptr;
};

class ModuleUser {
 public:
  ModuleUser(HostApi* api, HostUser* raw) : api_(api), raw_(raw) {}
  ModuleUser(ModuleUser&& other) noexcept;
  ModuleUser& operator=(ModuleUser&& other) noexcept;
  ModuleUser(const ModuleUser&) = delete;
  ModuleUser& operator=(const ModuleUser&) = delete;
  ~ModuleUser();

  HostUser* get() const { return raw_; }
  bool is_null() const { return raw_ == nullptr; }

 private:
  HostApi* api_ = nullptr;
  HostUser* raw_ = nullptr;
};

} // namespace modkit
