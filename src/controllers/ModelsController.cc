#include "ModelsController.h"
#include "ControllerUtils.h"
#include <drogon/drogon.h>

using namespace drogon;

ModelsController::ModelsController(std::shared_ptr<ModelsManager> models)
    : models_(std::move(models))
{
}

void ModelsController::listModels(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback)
{
    LOG_DEBUG << "[模型控制器] 获取模型列表";
    ctl::sendJson(callback, models_->getModelsJson());
}

void ModelsController::getModel(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback, std::string modelId)
{
    auto model = models_->getModel(modelId);
    if (!model) {
        ctl::sendError(callback, error::AppError::notFound("Model " + modelId + " not found"));
        return;
    }
    ctl::sendJson(callback, ModelsManager::modelToJson(*model));
}
