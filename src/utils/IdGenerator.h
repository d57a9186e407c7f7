#pragma once

#include <drogon/utils/Utilities.h>
#include <string>

/**
 * @brief 协议 A 对象 ID
 */
namespace ids {

inline std::string messageId()
{
    return "msg_" + drogon::utils::genRandomString(24);
}

inline std::string serverToolUseId()
{
    return "srvtoolu_" + drogon::utils::genRandomString(24);
}

inline std::string toolUseId()
{
    return "toolu_" + drogon::utils::genRandomString(24);
}

inline std::string batchId()
{
    return "batch_" + drogon::utils::getUuid();
}

} // namespace ids
