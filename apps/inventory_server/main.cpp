#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "app/InventoryApplication.h"
#include "app/InventoryConfig.h"
#include "Channel.h"
#include "EventLoop.h"
#include "LogMacros.h"
#include "Logger.h"

namespace fs = std::filesystem;

namespace {

// ========== 信号 ==========
// SIGINT / SIGTERM 在所有线程中屏蔽，经 signalfd 交给主 EventLoop 处理，
// 因此必须在创建任何线程之前构造，并先于 loop 析构。
class ShutdownSignals {
public:
    explicit ShutdownSignals(EventLoop* loop) {
        sigemptyset(&mask_);
        sigaddset(&mask_, SIGINT);
        sigaddset(&mask_, SIGTERM);
        if (int err = ::pthread_sigmask(SIG_BLOCK, &mask_, nullptr); err != 0)
            throw std::system_error(err, std::generic_category(), "pthread_sigmask");
        fd_ = ::signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC);
        if (fd_ < 0)
            throw std::system_error(errno, std::generic_category(), "signalfd");

        channel_ = std::make_unique<Channel>(loop, fd_);
        channel_->setReadCallback([this, loop](Timestamp) {
            signalfd_siginfo info{};
            while (::read(fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                LOG_INFO("Received {}, shutting down", ::strsignal(static_cast<int>(info.ssi_signo)));
                loop->quit();
            }
        });
        channel_->enableReading();
    }

    ~ShutdownSignals() {
        channel_->disableAll();
        channel_->remove();
        ::close(fd_);
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

private:
    sigset_t mask_{};
    int fd_ = -1;
    std::unique_ptr<Channel> channel_;
};

// ========== 配置路径 ==========
// 优先级：--config 参数 > INVENTORY_SERVER_CONFIG > bin/ 同级的源码树 > 当前目录
std::optional<fs::path> ResolveConfigPath(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config")
            return fs::path(argv[i + 1]);
    }
    if (const char* env = std::getenv("INVENTORY_SERVER_CONFIG"); env && *env)
        return fs::path(env);

    std::vector<fs::path> candidates;
    std::error_code ec;
    const fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (!ec)
        candidates.push_back(exe.parent_path() / "../apps/inventory_server/config/config.yaml");
    candidates.push_back(fs::current_path(ec) / "config/config.yaml");

    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec))
            return fs::weakly_canonical(candidate, ec);
    }
    return std::nullopt;
}

int Run(int argc, char* argv[]) {
    const auto configPath = ResolveConfigPath(argc, argv);
    if (!configPath) {
        std::cerr << "inventory_server: no config file found; pass --config <file> or set INVENTORY_SERVER_CONFIG" << std::endl;
        return 2;
    }
    const InventoryServerOptions options = InventoryServerOptions::FromConfig(configPath->string());

    EventLoop loop;
    ShutdownSignals signals(&loop);

    InventoryApplication app(&loop, options);
    app.start();
    LOG_INFO("{} running with config {}", options.serviceName, configPath->string());

    loop.loop();

    app.stop();
    LOG_INFO("{} stopped", options.serviceName);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    int exitCode = 1;
    try {
        exitCode = Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "inventory_server: " << e.what() << std::endl;
        LOG_ERROR("Fatal: {}", e.what());
    }
    Logger::instance().shutdown();
    return exitCode;
}
