#include "context.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <string>

namespace {

bool leak_free(const modkit::RespHost& host, const char* after) {
  if (host.live_users() != 0 || host.live_strings() != 0 || host.bad_releases() != 0) {
    std::cerr << "host objects leaked after " << after << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  modkit::RespHost host;
  const modkit::Context ctx(&host, host.context());
  host.add_user("reader", modkit::kKeyAccess, "app:");
  host.add_user("writer", modkit::kKeyAccess | modkit::kKeyInsert | modkit::kKeyUpdate, "app:");
  host.add_user("locked", modkit::kKeyAccess | modkit::kKeyInsert | modkit::kKeyDelete | modkit::kKeyUpdate, "",
                false);

  modkit::AclPermissions read;
  read.add_access_permission();
  modkit::AclPermissions write;
  write.add_insert_permission().add_update_permission();

  modkit::Error err;
  {
    const auto key = ctx.create_string("app:1");
    if (ctx.acl_check_key_permission("nobody", key, read, err) ||
        err.message() != "User does not exists or disabled") {
      std::cerr << "unknown user should fail before any check\n";
      return 1;
    }
    if (host.acl_checks() != 0) {
      std::cerr << "no permission check should run for an unknown user\n";
      return 1;
    }
    if (ctx.acl_check_key_permission("locked", key, read, err) ||
        err.message() != "User does not exists or disabled") {
      std::cerr << "disabled user should be treated as missing\n";
      return 1;
    }

    if (!ctx.acl_check_key_permission("reader", key, read, err)) {
      std::cerr << "reader should read app:1: " << err.message() << "\n";
      return 1;
    }
    if (ctx.acl_check_key_permission("reader", key, write, err) ||
        err.message() != "User does not have permissions on key") {
      std::cerr << "reader must not write\n";
      return 1;
    }
    if (!ctx.acl_check_key_permission("writer", key, write, err)) {
      std::cerr << "writer should write app:1\n";
      return 1;
    }
    if (host.acl_checks() != 3) {
      std::cerr << "expected three permission checks, got " << host.acl_checks() << "\n";
      return 1;
    }
  }
  if (!leak_free(host, "key checks")) return 1;

  {
    const auto other = ctx.create_string("other:1");
    if (ctx.acl_check_key_permission("writer", other, write, err)) {
      std::cerr << "key outside the user's pattern must be denied\n";
      return 1;
    }
  }
  if (!leak_free(host, "denied check")) return 1;

  // Current user and authentication.
  auto user = ctx.get_current_user(err);
  if (!user || *user != "default") {
    std::cerr << "current user should start as default\n";
    return 1;
  }
  if (ctx.authenticate_user("ghost") != modkit::Status::Err) {
    std::cerr << "authenticating an unknown user must fail\n";
    return 1;
  }
  if (ctx.authenticate_user("reader") != modkit::Status::Ok) {
    std::cerr << "authenticating reader failed\n";
    return 1;
  }
  user = ctx.get_current_user(err);
  if (!user || *user != "reader") {
    std::cerr << "current user should follow authentication\n";
    return 1;
  }
  if (!leak_free(host, "user lookups")) return 1;

  host.disable(modkit::Capability::AclUsers);
  {
    const auto key = ctx.create_string("app:1");
    if (ctx.acl_check_key_permission("reader", key, read, err) ||
        err.message() != "API RedisModule_GetModuleUserFromUserName is not available") {
      std::cerr << "missing ACL primitives should be reported: " << err.message() << "\n";
      return 1;
    }
  }
  if (!leak_free(host, "unavailable ACL")) return 1;

  std::cout << "acl_test passed\n";
  return 0;
}
