#pragma once

#include <string>

// MySQL 连接参数；url 形如 tcp://host:port
struct MySQLConnInfo {
    std::string url;
    std::string user;
    std::string password;
    std::string database;
    std::string charset{"utf8mb4"};
    int timeout_sec = 5;  // 连接、读、写超时

    bool validate() const { return !url.empty() && !user.empty() && !database.empty() && !charset.empty() && timeout_sec > 0; }

    // 日志用，不含密码
    std::string describe() const { return user + "@" + url + "/" + database; }
};
