#include "idheap.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <queue>
#include <random>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

struct GraphNodes {};

using NodeId = idheap::Id<GraphNodes>;
using IndexedQueue = idheap::IndexedMinQueue<GraphNodes, uint64_t>;
using LazyEntry = std::pair<uint64_t, uint32_t>;
using LazyQueue = std::priority_queue<LazyEntry, std::vector<LazyEntry>, std::greater<LazyEntry>>;

constexpr uint64_t kUnreached = std::numeric_limits<uint64_t>::max();

struct SummaryStats {
    double median_ms;
    double p95_ms;
};

struct BenchResult {
    SummaryStats indexed;
    SummaryStats lazy;
    double speedup_p50;
    double speedup_p95;
    bool checksums_match;
};

struct BenchConfig {
    int warmup_iterations;
    int measured_iterations;
};

struct Edge {
    uint32_t to;
    uint32_t weight;
};

// Adjacency in compressed rows: edges of node u are edges[offsets[u] .. offsets[u + 1]).
struct Graph {
    std::vector<size_t> offsets;
    std::vector<Edge> edges;

    size_t node_count() const noexcept { return offsets.empty() ? 0 : offsets.size() - 1; }
};

struct Update {
    uint32_t node;
    uint64_t value;
};

NodeId node_id(uint32_t index) {
    return NodeId(idheap::UntypedId::first(index));
}

bool parse_int_arg(const std::string& text, int min_value, int* out) {
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    if (parsed < static_cast<long>(min_value) ||
        parsed > static_cast<long>(std::numeric_limits<int>::max())) {
        return false;
    }

    *out = static_cast<int>(parsed);
    return true;
}

bool parse_sizes_arg(const std::string& text, std::vector<size_t>* out) {
    std::vector<size_t> parsed;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t comma = text.find(',', start);
        const size_t end = (comma == std::string::npos) ? text.size() : comma;
        if (end == start) {
            return false;
        }

        const std::string token = text.substr(start, end - start);
        char* tail = nullptr;
        errno = 0;
        const unsigned long long v = std::strtoull(token.c_str(), &tail, 10);
        if (errno != 0 || tail == token.c_str() || *tail != '\0' || v == 0ULL ||
            v > static_cast<unsigned long long>(std::numeric_limits<uint32_t>::max())) {
            return false;
        }
        parsed.push_back(static_cast<size_t>(v));

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (parsed.empty()) {
        return false;
    }
    *out = std::move(parsed);
    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name
              << " [--warmup N|-w N] [--iters N|-i N] [--sizes A,B,C|-s A,B,C]\n"
              << "  --warmup N  Warmup iterations (N >= 0, default 2)\n"
              << "  --iters N   Measured iterations (N >= 1, default 9)\n"
              << "  --sizes L   Comma-separated positive node counts (default 10000,100000,1000000)\n";
}

Graph generate_graph(size_t n, uint32_t seed) {
    constexpr size_t kOutDegree = 6;
    std::mt19937 rng(seed);
    std::uniform_int_distribution<uint32_t> node_dist(0, static_cast<uint32_t>(n - 1));
    std::uniform_int_distribution<uint32_t> weight_dist(1, 1000);

    Graph g;
    g.offsets.reserve(n + 1);
    g.edges.reserve(n * (kOutDegree + 1));
    g.offsets.push_back(0);
    for (size_t u = 0; u < n; ++u) {
        if (u + 1 < n) {
            g.edges.push_back({static_cast<uint32_t>(u + 1), weight_dist(rng)});
        }
        for (size_t k = 0; k < kOutDegree; ++k) {
            g.edges.push_back({node_dist(rng), weight_dist(rng)});
        }
        g.offsets.push_back(g.edges.size());
    }
    return g;
}

std::vector<Update> generate_updates(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<uint32_t> node_dist(0, static_cast<uint32_t>(n - 1));
    std::uniform_int_distribution<uint64_t> value_dist(0, 1000000);

    std::vector<Update> updates;
    updates.reserve(n * 4);
    for (size_t i = 0; i < n * 4; ++i) {
        updates.push_back({node_dist(rng), value_dist(rng)});
    }
    return updates;
}

uint64_t checksum(const std::vector<uint64_t>& dist) {
    uint64_t sum = 0;
    for (uint64_t d : dist) {
        if (d != kUnreached) sum += d;
    }
    return sum;
}

uint64_t dijkstra_indexed(const Graph& g) {
    std::vector<uint64_t> dist(g.node_count(), kUnreached);
    IndexedQueue queue;
    dist[0] = 0;
    queue.insert(node_id(0), 0);

    while (auto top = queue.pop()) {
        const uint32_t u = top->first.index();
        const uint64_t d = top->second;
        for (size_t e = g.offsets[u]; e < g.offsets[u + 1]; ++e) {
            const Edge& edge = g.edges[e];
            const uint64_t candidate = d + edge.weight;
            if (candidate < dist[edge.to]) {
                if (dist[edge.to] == kUnreached) {
                    queue.insert(node_id(edge.to), candidate);
                } else {
                    queue.decrease(node_id(edge.to), candidate);
                }
                dist[edge.to] = candidate;
            }
        }
    }
    return checksum(dist);
}

uint64_t dijkstra_lazy(const Graph& g) {
    std::vector<uint64_t> dist(g.node_count(), kUnreached);
    LazyQueue queue;
    dist[0] = 0;
    queue.push({0, 0});

    while (!queue.empty()) {
        const LazyEntry top = queue.top();
        queue.pop();
        const uint64_t d = top.first;
        const uint32_t u = top.second;
        if (d != dist[u]) continue;
        for (size_t e = g.offsets[u]; e < g.offsets[u + 1]; ++e) {
            const Edge& edge = g.edges[e];
            const uint64_t candidate = d + edge.weight;
            if (candidate < dist[edge.to]) {
                dist[edge.to] = candidate;
                queue.push({candidate, edge.to});
            }
        }
    }
    return checksum(dist);
}

// Applies every update as an upsert, then drains. Returns a checksum of the
// drained order.
uint64_t update_drain_indexed(size_t n, const std::vector<Update>& updates) {
    IndexedQueue queue;
    for (const Update& u : updates) {
        queue.insert(node_id(u.node), u.value);
    }
    uint64_t sum = 0;
    uint64_t rank = 0;
    while (auto top = queue.pop()) {
        sum += top->second * (++rank);
    }
    return sum + static_cast<uint64_t>(n);
}

uint64_t update_drain_lazy(size_t n, const std::vector<Update>& updates) {
    std::vector<uint64_t> current(n, kUnreached);
    LazyQueue queue;
    for (const Update& u : updates) {
        current[u.node] = u.value;
        queue.push({u.value, u.node});
    }
    uint64_t sum = 0;
    uint64_t rank = 0;
    while (!queue.empty()) {
        const LazyEntry top = queue.top();
        queue.pop();
        if (current[top.second] != top.first) continue;
        current[top.second] = kUnreached;
        sum += top.first * (++rank);
    }
    return sum + static_cast<uint64_t>(n);
}

double percentile_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    const double pos = p * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    if (lo == hi) {
        return sorted[lo];
    }
    const double weight = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * weight;
}

SummaryStats summarize_samples(const std::vector<double>& samples) {
    std::vector<double> sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    return {
        percentile_sorted(sorted, 0.50),
        percentile_sorted(sorted, 0.95),
    };
}

BenchResult finalize_result(
    const std::vector<double>& indexed_samples,
    const std::vector<double>& lazy_samples,
    bool checksums_match) {
    const SummaryStats indexed_stats = summarize_samples(indexed_samples);
    const SummaryStats lazy_stats = summarize_samples(lazy_samples);
    return {
        indexed_stats,
        lazy_stats,
        lazy_stats.median_ms / indexed_stats.median_ms,
        lazy_stats.p95_ms / indexed_stats.p95_ms,
        checksums_match,
    };
}

template <class IndexedFn, class LazyFn>
BenchResult run_pair(const BenchConfig& cfg, IndexedFn indexed_fn, LazyFn lazy_fn) {
    std::vector<double> indexed_samples;
    std::vector<double> lazy_samples;
    indexed_samples.reserve(static_cast<size_t>(cfg.measured_iterations));
    lazy_samples.reserve(static_cast<size_t>(cfg.measured_iterations));
    bool checksums_match = true;

    for (int iter = 0; iter < cfg.warmup_iterations + cfg.measured_iterations; ++iter) {
        auto start = Clock::now();
        const uint64_t indexed_sum = indexed_fn();
        auto end = Clock::now();
        if (iter >= cfg.warmup_iterations) {
            indexed_samples.push_back(Duration(end - start).count());
        }

        start = Clock::now();
        const uint64_t lazy_sum = lazy_fn();
        end = Clock::now();
        if (iter >= cfg.warmup_iterations) {
            lazy_samples.push_back(Duration(end - start).count());
        }

        checksums_match = checksums_match && (indexed_sum == lazy_sum);
    }

    return finalize_result(indexed_samples, lazy_samples, checksums_match);
}

BenchResult bench_dijkstra(size_t n, const BenchConfig& cfg) {
    const Graph g = generate_graph(n, 12345);
    return run_pair(cfg,
                    [&]() { return dijkstra_indexed(g); },
                    [&]() { return dijkstra_lazy(g); });
}

BenchResult bench_update_drain(size_t n, const BenchConfig& cfg) {
    const auto updates = generate_updates(n, 54321);
    return run_pair(cfg,
                    [&]() { return update_drain_indexed(n, updates); },
                    [&]() { return update_drain_lazy(n, updates); });
}

void print_result(const std::string& test_name, size_t n, const BenchResult& result) {
    std::cout << std::left << std::setw(20) << test_name
              << std::right << std::setw(10) << n
              << std::fixed << std::setprecision(3)
              << std::setw(13) << result.indexed.median_ms
              << std::setw(13) << result.indexed.p95_ms
              << std::setw(13) << result.lazy.median_ms
              << std::setw(13) << result.lazy.p95_ms
              << std::setw(13) << result.speedup_p50 << "x"
              << std::setw(13) << result.speedup_p95 << "x"
              << "\n";
}

int main(int argc, char** argv) {
    std::cout << "=== IndexedMinQueue vs lazy std::priority_queue Benchmark ===\n\n";
    std::cout << "Heap arity (d): " << IDHEAP_ARITY << "\n";
    std::cout << "Debug checks: " << (IDHEAP_DEBUG_CHECKS ? "on" : "off") << "\n\n";

    BenchConfig cfg{2, 9};
    std::vector<size_t> sizes = {10000, 100000, 1000000};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--warmup" || arg == "-w") {
            if (i + 1 >= argc || !parse_int_arg(argv[i + 1], 0, &cfg.warmup_iterations)) {
                std::cerr << "Invalid value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            ++i;
            continue;
        }
        if (arg == "--iters" || arg == "-i") {
            if (i + 1 >= argc || !parse_int_arg(argv[i + 1], 1, &cfg.measured_iterations)) {
                std::cerr << "Invalid value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            ++i;
            continue;
        }
        if (arg == "--sizes" || arg == "-s") {
            if (i + 1 >= argc || !parse_sizes_arg(argv[i + 1], &sizes)) {
                std::cerr << "Invalid value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            ++i;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "Warmup iterations: " << cfg.warmup_iterations
              << ", measured iterations: " << cfg.measured_iterations << "\n\n";

    std::cout << std::left << std::setw(20) << "Test"
              << std::right << std::setw(10) << "N"
              << std::setw(13) << "Indexed p50"
              << std::setw(13) << "Indexed p95"
              << std::setw(13) << "Lazy p50"
              << std::setw(13) << "Lazy p95"
              << std::setw(13) << "Spd(p50)"
              << std::setw(13) << "Spd(p95)"
              << "\n";
    std::cout << std::string(105, '-') << "\n";

    bool all_match = true;
    for (size_t n : sizes) {
        const BenchResult result = bench_dijkstra(n, cfg);
        all_match = all_match && result.checksums_match;
        print_result("dijkstra", n, result);
    }

    std::cout << "\n";

    for (size_t n : sizes) {
        const BenchResult result = bench_update_drain(n, cfg);
        all_match = all_match && result.checksums_match;
        print_result("update+drain", n, result);
    }

    if (!all_match) {
        std::cerr << "\nChecksum mismatch between indexed and lazy queues\n";
        return 1;
    }

    std::cout << "\n=== Benchmark complete ===\n";
    return 0;
}
