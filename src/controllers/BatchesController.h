#pragma once

#include <drogon/HttpController.h>
#include <batchManager/BatchManager.h>
#include <memory>

/**
 * @brief Message Batches API
 */
class BatchesController : public drogon::HttpController<BatchesController, false>
{
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(BatchesController::create, "/v1/messages/batches", drogon::Post);
    ADD_METHOD_TO(BatchesController::list, "/v1/messages/batches", drogon::Get);
    ADD_METHOD_TO(BatchesController::get, "/v1/messages/batches/{1}", drogon::Get);
    ADD_METHOD_TO(BatchesController::cancel, "/v1/messages/batches/{1}/cancel", drogon::Post);
    ADD_METHOD_TO(BatchesController::results, "/v1/messages/batches/{1}/results", drogon::Get);
    METHOD_LIST_END

    explicit BatchesController(std::shared_ptr<BatchManager> batches);

    void create(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void list(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void get(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback, std::string batchId);
    void cancel(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback, std::string batchId);
    void results(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback, std::string batchId);

  private:
    std::shared_ptr<BatchManager> batches_;
};
