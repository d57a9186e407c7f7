#pragma once

#include <drogon/HttpController.h>
#include <services/MessageService.h>
#include <memory>

/**
 * @brief Messages API：/v1/messages 与 /v1/messages/count_tokens
 */
class MessagesController : public drogon::HttpController<MessagesController, false>
{
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(MessagesController::createMessage, "/v1/messages", drogon::Post);
    ADD_METHOD_TO(MessagesController::countTokens, "/v1/messages/count_tokens", drogon::Post);
    METHOD_LIST_END

    explicit MessagesController(std::shared_ptr<MessageService> service);

    void createMessage(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void countTokens(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);

  private:
    std::shared_ptr<MessageService> service_;
};
