#include "interface/mq/InventoryCommandRouter.h"

#include <chrono>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

#include "LogMacros.h"
#include "MQProducer.h"
#include "domain/InventoryDomainService.h"
#include "domain/InventoryErrors.h"
#include "infra/mq/InventoryEventConsumer.h"
#include "infra/mq/MQStockEventPublisher.h"

using json = nlohmann::json;

namespace {

std::string RequireString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty())
        throw InvalidArgument(std::string("missing string field '") + field + "'");
    return it->get<std::string>();
}

// get<int>() 会静默截断 64 位值，这里先按宽类型取出再检查范围
int ToInt(const json& value, const char* field) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(kMax))
            throw InvalidArgument(std::format("field '{}' is out of range: {}", field, v));
        return static_cast<int>(v);
    }
    const auto v = value.get<std::int64_t>();
    if (v < kMin || v > kMax)
        throw InvalidArgument(std::format("field '{}' is out of range: {}", field, v));
    return static_cast<int>(v);
}

int RequireInt(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number_integer())
        throw InvalidArgument(std::string("missing integer field '") + field + "'");
    return ToInt(*it, field);
}

int OptionalInt(const json& j, const char* field, int defaultValue) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return defaultValue;
    if (!it->is_number_integer())
        throw InvalidArgument(std::string("field '") + field + "' must be an integer");
    return ToInt(*it, field);
}

std::optional<std::string> OptionalString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw InvalidArgument(std::string("field '") + field + "' must be a string");
    return it->get<std::string>();
}

json ReservationJson(const Reservation& r) {
    json j;
    j["reservationId"] = r.id();
    j["productRef"] = r.key().productRef;
    j["variantRef"] = r.key().variantRef ? json(*r.key().variantRef) : json(nullptr);
    j["quantity"] = r.quantity();
    j["status"] = ToString(r.status());
    j["expiresAt"] = FormatTimestamp(r.expiresAt());
    return j;
}

}  // namespace

// ========== 构造与初始化 ==========

InventoryCommandRouter::InventoryCommandRouter(Dependencies deps) : InventoryCommandRouter(std::move(deps), Options{}) {}

InventoryCommandRouter::InventoryCommandRouter(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

void InventoryCommandRouter::Initialize() {
    registerHandler("reserve", [this](const json& req, json& reply) { onReserve(req, reply); });
    registerHandler("confirm", [this](const json& req, json& reply) { onConfirm(req, reply); });
    registerHandler("release", [this](const json& req, json& reply) { onRelease(req, reply); });
    registerHandler("adjust", [this](const json& req, json& reply) { onAdjust(req, reply); });
    registerHandler("check", [this](const json& req, json& reply) { onCheck(req, reply); });

    if (options_.enableLogging)
        LOG_INFO("[InventoryCommandRouter] Initialized with {} handlers.", handlers_.size());
}

// ========== 启动与停止 ==========

void InventoryCommandRouter::Start() {
    if (running_)
        return;
    if (!deps_.consumer) {
        LOG_ERROR("[InventoryCommandRouter] Missing InventoryEventConsumer dependency.");
        return;
    }

    running_ = true;
    deps_.consumer->Start([this](const std::string& payload) { routeMessage(payload); });

    if (options_.enableLogging)
        LOG_INFO("[InventoryCommandRouter] Started routing inventory commands.");
}

void InventoryCommandRouter::Stop() {
    if (!running_)
        return;
    running_ = false;
    if (deps_.consumer)
        deps_.consumer->Stop();

    if (options_.enableLogging)
        LOG_INFO("[InventoryCommandRouter] Stopped routing inventory commands.");
}

// ========== 消息路由核心逻辑 ==========

void InventoryCommandRouter::routeMessage(const std::string& payload) {
    const std::string reply = Dispatch(payload);
    if (!deps_.producer)
        return;

    std::string replyTo = options_.defaultReplyTo;
    json request = json::parse(payload, nullptr, false);
    if (!request.is_discarded() && request.is_object()) {
        auto it = request.find("replyTo");
        if (it != request.end() && it->is_string() && !it->get<std::string>().empty())
            replyTo = it->get<std::string>();
    }
    if (!deps_.producer->publish("", replyTo, reply))
        LOG_WARN("[InventoryCommandRouter] Reply to {} dropped", replyTo);
}

std::string InventoryCommandRouter::Dispatch(const std::string& payload) {
    json reply;
    reply["requestId"] = nullptr;

    json request = json::parse(payload, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        reply["ok"] = false;
        reply["code"] = ToString(InventoryErrc::kInvalidArgument);
        reply["error"] = "payload is not a JSON object";
        return reply.dump();
    }
    if (auto it = request.find("requestId"); it != request.end())
        reply["requestId"] = *it;

    const std::string command = request.value("command", std::string());
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        reply["ok"] = false;
        reply["code"] = ToString(InventoryErrc::kInvalidArgument);
        reply["error"] = "unknown command '" + command + "'";
        LOG_WARN("[InventoryCommandRouter] No handler registered for command: {}", command);
        return reply.dump();
    }
    if (!deps_.inventory) {
        reply["ok"] = false;
        reply["code"] = ToString(InventoryErrc::kStorageFailure);
        reply["error"] = "inventory service unavailable";
        return reply.dump();
    }

    if (options_.enableLogging)
        LOG_DEBUG("[InventoryCommandRouter] Dispatching command: {}", command);

    try {
        it->second(request, reply);
        reply["ok"] = true;
    } catch (const InventoryError& e) {
        reply["ok"] = false;
        reply["code"] = ToString(e.code());
        reply["error"] = e.what();
        reply["transient"] = e.IsTransient();
        if (e.IsTransient())
            LOG_WARN("[InventoryCommandRouter] {} failed transiently: {}", command, e.what());
    } catch (const json::exception& e) {
        reply["ok"] = false;
        reply["code"] = ToString(InventoryErrc::kInvalidArgument);
        reply["error"] = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("[InventoryCommandRouter] Handler exception for {}: {}", command, e.what());
        reply["ok"] = false;
        reply["code"] = ToString(InventoryErrc::kStorageFailure);
        reply["error"] = e.what();
    }
    return reply.dump();
}

void InventoryCommandRouter::registerHandler(std::string_view command, Handler handler) {
    handlers_.emplace(std::string(command), std::move(handler));
}

// ========== 命令处理函数 ==========

void InventoryCommandRouter::onReserve(const json& req, json& reply) {
    InventoryDomainService::ReserveRequest r;
    r.productRef = RequireString(req, "productRef");
    r.variantRef = OptionalString(req, "variantRef");
    r.quantity = RequireInt(req, "quantity");
    r.requesterId = RequireString(req, "requesterId");
    r.correlationId = OptionalString(req, "correlationId");
    r.source = OptionalString(req, "source");
    if (req.contains("ttlSeconds"))
        r.ttl = std::chrono::seconds(RequireInt(req, "ttlSeconds"));

    reply["reservation"] = ReservationJson(deps_.inventory->ReserveStock(r));
}

void InventoryCommandRouter::onConfirm(const json& req, json& reply) {
    reply["reservation"] = ReservationJson(deps_.inventory->ConfirmReservation(RequireString(req, "reservationId")));
}

void InventoryCommandRouter::onRelease(const json& req, json& reply) {
    const auto reason = OptionalString(req, "reason").value_or("released by request");
    reply["reservation"] = ReservationJson(deps_.inventory->ReleaseStock(RequireString(req, "reservationId"), reason));
}

void InventoryCommandRouter::onAdjust(const json& req, json& reply) {
    auto ledger = deps_.inventory->AdjustStock(RequireString(req, "productRef"), OptionalString(req, "variantRef"), RequireInt(req, "newTotal"),
                                               OptionalString(req, "reason").value_or("stock adjustment"), OptionalString(req, "actor"));
    reply["quantityAvailable"] = ledger.quantityAvailable();
    reply["quantityReserved"] = ledger.quantityReserved();
    reply["lowStock"] = ledger.IsLowStock();
}

void InventoryCommandRouter::onCheck(const json& req, json& reply) {
    auto it = req.find("items");
    if (it == req.end() || !it->is_array())
        throw InvalidArgument("missing array field 'items'");

    std::vector<InventoryDomainService::StockCheckItem> items;
    for (const auto& entry : *it) {
        InventoryDomainService::StockCheckItem item;
        item.productRef = RequireString(entry, "productRef");
        item.variantRef = OptionalString(entry, "variantRef");
        item.quantity = OptionalInt(entry, "quantity", 0);
        items.push_back(std::move(item));
    }

    json levels = json::array();
    for (const auto& level : deps_.inventory->BulkStockCheck(items)) {
        json l;
        l["productRef"] = level.key.productRef;
        l["variantRef"] = level.key.variantRef ? json(*level.key.variantRef) : json(nullptr);
        l["tracked"] = level.tracked;
        l["quantityAvailable"] = level.quantityAvailable;
        l["quantityReserved"] = level.quantityReserved;
        l["inStock"] = level.inStock;
        l["lowStock"] = level.lowStock;
        levels.push_back(std::move(l));
    }
    reply["items"] = std::move(levels);
}
