#include "handles.hpp"

#include <utility>

namespace modkit {

ModuleString::ModuleString(HostApi* api, HostContext* ctx, std::string_view bytes) : api_(api), ctx_(ctx) {
  if (api_) raw_ = api_->create_string(ctx_, bytes.data(), bytes.size());
}

ModuleString::ModuleString(const ModuleString& other) : api_(other.api_), ctx_(other.ctx_), raw_(other.raw_) {
  if (raw_) api_->retain_string(ctx_, raw_);
}

ModuleString::ModuleString(ModuleString&& other) noexcept
    : api_(other.api_), ctx_(other.ctx_), raw_(std::exchange(other.raw_, nullptr)) {}

ModuleString& ModuleString::operator=(const ModuleString& other) {
  if (this == &other) return *this;
  if (other.raw_) other.api_->retain_string(other.ctx_, other.raw_);
  release();
  api_ = other.api_;
  ctx_ = other.ctx_;
  raw_ = other.raw_;
  return *this;
}

ModuleString& ModuleString::operator=(ModuleString&& other) noexcept {
  if (this == &other) return *this;
  release();
  api_ = other.api_;
  ctx_ = other.ctx_;
  raw_ = std::exchange(other.raw_, nullptr);
  return *this;
}

ModuleString::~ModuleString() { release(); }

ModuleString ModuleString::adopt(HostApi* api, HostContext* ctx, HostString* raw) {
  ModuleString s;
  s.api_ = api;
  s.ctx_ = ctx;
  s.raw_ = raw;
  return s;
}

std::string_view ModuleString::bytes() const {
  if (!raw_) return {};
  std::size_t len = 0;
  const char* p = api_->string_ptr_len(raw_, &len);
  if (!p) return {};
  return std::string_view(p, len);
}

void ModuleString::release() {
  if (raw_) {
    api_->free_string(ctx_, raw_);
    raw_ = nullptr;
  }
}

CallReply::CallReply(CallReply&& other) noexcept : api_(other.api_), raw_(std::exchange(other.raw_, nullptr)) {}

CallReply& CallReply::operator=(CallReply&& other) noexcept {
  if (this == &other) return *this;
  if (raw_) api_->free_call_reply(raw_);
  api_ = other.api_;
  raw_ = std::exchange(other.raw_, nullptr);
  return *this;
}

CallReply::~CallReply() {
  if (raw_) api_->free_call_reply(raw_);
}

ModuleUser::ModuleUser(ModuleUser&& other) noexcept : api_(other.api_), raw_(std::exchange(other.raw_, nullptr)) {}

ModuleUser& ModuleUser::operator=(ModuleUser&& other) noexcept {
  if (this == &other) return *this;
  if (raw_) api_->free_module_user(raw_);
  api_ = other.api_;
  raw_ = std::exchange(other.raw_, nullptr);
  return *this;
}

ModuleUser::~ModuleUser() {
  if (raw_) api_->free_module_user(raw_);
}

}  // namespace modkit
