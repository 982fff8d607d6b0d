#include "host_api.hpp"

namespace modkit {

const char* capability_api_name(Capability cap) {
  switch (cap) {
    case Capability::Resp3Replies:
      return "API RedisModule_ReplyWithMap is not available";
    case Capability::ServerVersion:
      return "API RedisModule_GetServerVersion is not available";
    case Capability::CurrentUserName:
      return "API RedisModule_GetCurrentUserName is not available";
    case Capability::AuthenticateUser:
      return "API RedisModule_AuthenticateClientWithACLUser is not available";
    case Capability::AclUsers:
      return "API RedisModule_GetModuleUserFromUserName is not available";
    case Capability::CurrentCommandName:
      return "API RedisModule_GetCurrentCommandName is not available";
    case Capability::KeysPositionRequest:
      return "API RedisModule_IsKeysPositionRequest is not available";
    case Capability::ModuleOptions:
      return "API RedisModule_SetModuleOptions is not available";
    case Capability::KeyspaceNotifications:
      return "API RedisModule_NotifyKeyspaceEvent is not available";
    case Capability::InfoFields:
      return "API RedisModule_InfoAddSection is not available";
    case Capability::SharedApi:
      return "API RedisModule_ExportSharedAPI is not available";
  }
  return "API is not available";
}

}  // namespace modkit
