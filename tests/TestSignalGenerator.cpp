#include "strategy/SignalGenerator.h"
#include "engine/ReportJson.h"
#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>

using namespace liqhunter;
using liqhunter::strategy::SignalConfig;
using liqhunter::strategy::SignalGenerator;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

int g_next_id = 0;

Cluster cluster(double price, PositionSide side, double strength, double current = 100.0) {
    Cluster c;
    c.cluster_id = g_next_id++;
    c.generation = 1;
    c.symbol = "BTCUSDT";
    c.price = price;
    c.side = side;
    c.strength = strength;
    c.total_weight = strength * 1000.0;
    c.member_count = 1;
    c.distance_pct = std::abs(price - current) / current * 100.0;
    return c;
}

void checkInvariants(const Signal& s) {
    if (s.direction == Direction::NEUTRAL) {
        assert(!s.entry && !s.stop_loss && !s.take_profit);
        assert(s.confidence == 0.0);
        assert(!s.source_cluster);
        return;
    }
    assert(s.entry && s.stop_loss && s.take_profit && s.risk_reward && s.source_cluster);
    assert(*s.entry == s.current_price);
    if (s.direction == Direction::LONG) {
        assert(*s.stop_loss < *s.entry && *s.entry < *s.take_profit);
    } else {
        assert(*s.take_profit < *s.entry && *s.entry < *s.stop_loss);
    }
    const double risk = std::abs(*s.entry - *s.stop_loss);
    const double reward = std::abs(*s.take_profit - *s.entry);
    assert(near(*s.risk_reward, reward / risk, 1e-12));
    assert(s.confidence == s.source_cluster->strength);
}
}

int main() {
    SignalConfig config;   // 0.6 / 3% / 0.5% / sl 1.5% / tp buffer 0.5%
    SignalGenerator generator(config);

    {
        // price=100, short 클러스터 102 (strength 1.0)
        auto c = cluster(102.0, PositionSide::SHORT, 1.0);
        auto s = generator.generate("BTCUSDT", 100.0, {c});
        checkInvariants(s);
        assert(s.direction == Direction::LONG);
        assert(*s.entry == 100.0);
        assert(near(*s.stop_loss, 98.5));
        assert(near(*s.take_profit, 102.51));
        assert(SignalGenerator::takeProfitDistancePct(*s.entry, *s.take_profit) >= 0.5);
        assert(near(*s.risk_reward, 2.51 / 1.5, 1e-9));
        assert(s.confidence == 1.0);
        assert(s.source_cluster->cluster_id == c.cluster_id);
        assert(s.source_cluster->side == PositionSide::SHORT);
        assert(!s.reason.empty());
    }

    {
        // 100.2 클러스터: 목표가 ~100.7 (0.7%) 통과
        auto s = generator.generate("BTCUSDT", 100.0, {cluster(100.2, PositionSide::SHORT, 0.9)});
        checkInvariants(s);
        assert(s.direction == Direction::LONG);
        assert(near(*s.take_profit, 100.2 * 1.005));
        assert(SignalGenerator::takeProfitDistancePct(100.0, *s.take_profit) > 0.69);
    }

    {
        // 목표가 거리 == 최소값 => 채택 (inclusive)
        SignalConfig exact = config;
        exact.take_profit_buffer_pct = 0.1;
        const double cluster_price = 100.4;
        exact.min_take_profit_pct = SignalGenerator::takeProfitDistancePct(100.0, cluster_price * 1.001);
        SignalGenerator exact_generator(exact);
        auto s = exact_generator.generate("BTCUSDT", 100.0, {cluster(cluster_price, PositionSide::SHORT, 0.9)});
        assert(s.direction == Direction::LONG);
        checkInvariants(s);

        SignalConfig half = config;
        half.take_profit_buffer_pct = 0.1;
        half.min_take_profit_pct = 0.5;
        SignalGenerator half_generator(half);
        auto s2 = half_generator.generate("BTCUSDT", 100.0, {cluster(100.5 / 1.001, PositionSide::SHORT, 0.9)});
        assert(s2.direction == Direction::LONG);

        // 최소값 미만 => 폐기 => NEUTRAL
        auto s3 = half_generator.generate("BTCUSDT", 100.0, {cluster(100.1, PositionSide::SHORT, 0.9)});
        assert(s3.direction == Direction::NEUTRAL);
        checkInvariants(s3);
    }

    {
        // 약하거나 먼 클러스터만 있음 => NEUTRAL
        auto s = generator.generate("BTCUSDT", 100.0, {
            cluster(102.0, PositionSide::SHORT, 0.3),
            cluster(98.0, PositionSide::LONG, 0.5),
            cluster(105.0, PositionSide::SHORT, 0.95),
            cluster(94.0, PositionSide::LONG, 1.0)
        });
        assert(s.direction == Direction::NEUTRAL);
        assert(s.confidence == 0.0);
        assert(!s.entry && !s.stop_loss && !s.take_profit && !s.risk_reward);
        checkInvariants(s);
    }

    {
        auto s = generator.generate("BTCUSDT", 100.0, {});
        assert(s.direction == Direction::NEUTRAL);
        checkInvariants(s);
    }

    {
        // strength 동률 => 가까운 쪽
        auto near_c = cluster(101.0, PositionSide::SHORT, 0.8);
        auto far_c = cluster(102.0, PositionSide::SHORT, 0.8);
        auto s = generator.generate("BTCUSDT", 100.0, {far_c, near_c});
        assert(s.direction == Direction::LONG);
        assert(s.source_cluster->price == 101.0);

        // strength/거리 동률 => 낮은 가격
        auto a = cluster(101.5, PositionSide::SHORT, 0.8);
        auto b = cluster(101.0, PositionSide::SHORT, 0.8);
        a.distance_pct = 1.0;
        b.distance_pct = 1.0;
        auto s2 = generator.generate("BTCUSDT", 100.0, {a, b});
        assert(s2.source_cluster->price == 101.0);
        auto s3 = generator.generate("BTCUSDT", 100.0, {b, a});
        assert(s3.source_cluster->price == 101.0);

        // 최고 strength 우선
        auto strong = cluster(102.5, PositionSide::SHORT, 0.95);
        auto s4 = generator.generate("BTCUSDT", 100.0, {near_c, strong});
        assert(s4.source_cluster->price == 102.5);
    }

    {
        // 1순위 LONG 후보가 목표가 검증 실패 => 다음 LONG 후보
        SignalConfig wide = config;
        wide.min_take_profit_pct = 1.0;
        SignalGenerator wide_generator(wide);
        auto s = wide_generator.generate("BTCUSDT", 100.0, {
            cluster(100.2, PositionSide::SHORT, 0.95),
            cluster(101.0, PositionSide::SHORT, 0.7)
        });
        assert(s.direction == Direction::LONG);
        assert(s.source_cluster->price == 101.0);
        checkInvariants(s);

        // LONG 전부 실패 => SHORT
        auto s2 = wide_generator.generate("BTCUSDT", 100.0, {
            cluster(100.2, PositionSide::SHORT, 0.95),
            cluster(98.0, PositionSide::LONG, 0.7)
        });
        assert(s2.direction == Direction::SHORT);
        assert(near(*s2.stop_loss, 101.5));
        assert(near(*s2.take_profit, 98.0 * 0.995));
        checkInvariants(s2);
    }

    {
        // 양방향 모두 유효 => LONG 우선 (SHORT 쪽이 더 강해도)
        auto s = generator.generate("BTCUSDT", 100.0, {
            cluster(102.0, PositionSide::SHORT, 0.6),
            cluster(98.0, PositionSide::LONG, 1.0)
        });
        assert(s.direction == Direction::LONG);
        assert(SignalGenerator::kDirectionPriority[0] == Direction::LONG);

        auto short_only = generator.evaluateDirection("BTCUSDT", 100.0, {
            cluster(102.0, PositionSide::SHORT, 0.6),
            cluster(98.0, PositionSide::LONG, 1.0)
        }, Direction::SHORT);
        assert(short_only && short_only->direction == Direction::SHORT);
        checkInvariants(*short_only);
    }

    {
        // 방향 불일치 / 비활성 클러스터는 후보가 아님
        auto wrong_side = cluster(102.0, PositionSide::LONG, 1.0);
        auto below = cluster(98.0, PositionSide::SHORT, 1.0);
        auto inactive = cluster(101.0, PositionSide::SHORT, 1.0);
        inactive.active = false;
        auto s = generator.generate("BTCUSDT", 100.0, {wrong_side, below, inactive});
        assert(s.direction == Direction::NEUTRAL);
    }

    {
        // 가격 없음 => 실행 거부
        bool threw = false;
        try {
            generator.generate("BTCUSDT", 0.0, {cluster(102.0, PositionSide::SHORT, 1.0)});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            generator.generate("BTCUSDT", std::numeric_limits<double>::quiet_NaN(), {});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    {
        // 동일 입력 => 동일 출력 (직렬화 바이트 단위)
        std::vector<Cluster> clusters = {
            cluster(101.0, PositionSide::SHORT, 0.8),
            cluster(99.0, PositionSide::LONG, 0.9),
            cluster(102.0, PositionSide::SHORT, 0.8)
        };
        const auto first = engine::toJson(generator.generate("BTCUSDT", 100.0, clusters)).dump();
        for (int i = 0; i < 5; ++i) {
            assert(engine::toJson(generator.generate("BTCUSDT", 100.0, clusters)).dump() == first);
        }
    }

    {
        // 무작위 클러스터 집합에서 불변식 유지
        std::mt19937 rng(2024);
        std::uniform_real_distribution<double> price_dist(95.0, 105.0);
        std::uniform_real_distribution<double> strength_dist(0.0, 1.0);
        for (int round = 0; round < 200; ++round) {
            std::vector<Cluster> clusters;
            for (int i = 0; i < 6; ++i) {
                const double p = price_dist(rng);
                clusters.push_back(cluster(p, strength_dist(rng) < 0.5 ? PositionSide::LONG : PositionSide::SHORT,
                                           strength_dist(rng)));
            }
            checkInvariants(generator.generate("BTCUSDT", 100.0, clusters));
        }
    }

    {
        bool threw = false;
        try {
            SignalConfig bad = config;
            bad.min_strength = -0.1;
            SignalGenerator::validate(bad);
        } catch (const common::ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
