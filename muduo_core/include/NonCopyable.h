#pragma once

// 禁止拷贝的基类：派生类对象可以正常构造/析构，但不能拷贝构造与拷贝赋值
class NonCopyable {
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

protected:
    NonCopyable() = default;
    ~NonCopyable() = default;
};
