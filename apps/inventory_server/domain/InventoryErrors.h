#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// 领域错误码，同时作为 MQ 应答中的 code 字段
enum class InventoryErrc : std::uint8_t {
    kInsufficientStock = 0,
    kInvalidRelease,
    kInvalidConfirm,
    kInvalidAdjustment,
    kInvalidQuantity,
    kInvalidArgument,
    kReservationNotFound,
    kInvalidState,
    kProductNotTracked,
    kProductNotFound,
    kConcurrencyConflict,
    kStorageFailure,
};

std::string ToString(InventoryErrc code);

/**
 * @brief InventoryError：库存领域异常基类
 *
 * 所有业务校验都在修改状态之前完成，抛出即意味着没有任何副作用。
 * IsTransient() 为 true 的错误（并发冲突、存储故障）调用方可以重试。
 */
class InventoryError : public std::runtime_error {
public:
    InventoryError(InventoryErrc code, const std::string& message) : std::runtime_error(message), code_(code) {}

    InventoryErrc code() const noexcept { return code_; }
    bool IsTransient() const noexcept { return code_ == InventoryErrc::kConcurrencyConflict || code_ == InventoryErrc::kStorageFailure; }

private:
    InventoryErrc code_;
};

class InsufficientStock : public InventoryError {
public:
    InsufficientStock(int requested, int available);

    int requested() const noexcept { return requested_; }
    int available() const noexcept { return available_; }

private:
    int requested_;
    int available_;
};

class InvalidRelease : public InventoryError {
public:
    InvalidRelease(int quantity, int reserved);
};

class InvalidConfirm : public InventoryError {
public:
    InvalidConfirm(int quantity, int reserved);
};

class InvalidAdjustment : public InventoryError {
public:
    explicit InvalidAdjustment(const std::string& message) : InventoryError(InventoryErrc::kInvalidAdjustment, message) {}
};

class InvalidQuantity : public InventoryError {
public:
    explicit InvalidQuantity(int quantity);
};

class InvalidArgument : public InventoryError {
public:
    explicit InvalidArgument(const std::string& message) : InventoryError(InventoryErrc::kInvalidArgument, message) {}
};

class ReservationNotFound : public InventoryError {
public:
    explicit ReservationNotFound(const std::string& reservationId);
};

class InvalidState : public InventoryError {
public:
    InvalidState(const std::string& reservationId, std::string_view detail);
};

class ProductNotTracked : public InventoryError {
public:
    explicit ProductNotTracked(const std::string& stockKey);
};

class ProductNotFound : public InventoryError {
public:
    explicit ProductNotFound(const std::string& productRef);
};

// 乐观锁版本不一致、死锁、锁等待超时
class ConcurrencyConflict : public InventoryError {
public:
    explicit ConcurrencyConflict(const std::string& message) : InventoryError(InventoryErrc::kConcurrencyConflict, message) {}
};

class StorageFailure : public InventoryError {
public:
    explicit StorageFailure(const std::string& message) : InventoryError(InventoryErrc::kStorageFailure, message) {}
};
