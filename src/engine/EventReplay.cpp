#include "engine/EventReplay.h"
#include "common/Logger.h"
#include "network/LiquidationEventParser.h"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace liqhunter {
namespace engine {

namespace {
constexpr int kPollIntervalMs = 200;
}

int replayEvents(int fd, LiquidationEngine& engine, const std::atomic<bool>& stop) {
    std::string pending;
    char buf[4096];
    int accepted = 0;
    int rejected = 0;
    bool eof = false;

    auto consume = [&](const std::string& line) {
        if (line.empty()) {
            return;
        }
        auto event = network::LiquidationEventParser::parseText(line);
        if (event && engine.ingestLiquidation(*event)) {
            ++accepted;
        } else {
            ++rejected;
        }
    };

    while (!stop) {
        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("이벤트 입력 poll 실패: {}", std::strerror(errno));
            break;
        }

        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_WARN("이벤트 입력 read 실패: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            consume(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }

    if (eof) {
        consume(pending);
    }

    LOG_INFO("이벤트 입력 종료 - {}건 수집, {}건 거부{}", accepted, rejected, eof ? "" : " (중지)");
    return accepted;
}

} // namespace engine
} // namespace liqhunter
