#pragma once

#include <drogon/HttpController.h>
#include <modelsManager/ModelsManager.h>
#include <memory>

class ModelsController : public drogon::HttpController<ModelsController, false>
{
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ModelsController::listModels, "/v1/models", drogon::Get);
    ADD_METHOD_TO(ModelsController::getModel, "/v1/models/{1}", drogon::Get);
    METHOD_LIST_END

    explicit ModelsController(std::shared_ptr<ModelsManager> models);

    void listModels(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void getModel(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback, std::string modelId);

  private:
    std::shared_ptr<ModelsManager> models_;
};
