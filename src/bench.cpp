#include "sphere/sphere.hpp"

#include <benchmark/benchmark.h>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;
static int flag_rate = 16000;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--markdown")
            flag_markdown = true;
        else if (arg.starts_with("--rate="))
            flag_rate = std::stoi(arg.substr(7));
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Parse audio_sec from benchmark name like "decode_2byte/5/real_time"
static int parse_audio_sec(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return 0;
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    try {
        return std::stoi(arg_str);
    } catch (const std::exception &) {
        return 0;
    }
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Audio (s) | Time (ms) | Speed |\n";
        std::cout << "|-----------|-----------|-----------|-------|\n";

        for (const auto &r : runs_) {
            if (r.error_occurred)
                continue;

            auto name = r.benchmark_name();
            int audio_sec = parse_audio_sec(name);
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double speed =
                time_ms > 0 ? audio_sec / (time_ms / 1000.0) : 0;

            std::cout << "| " << name.substr(0, name.find('/')) << " | "
                      << audio_sec << " | " << std::fixed
                      << std::setprecision(3) << time_ms << " | "
                      << std::setprecision(0) << speed << "x |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic audio ────────────────────────────────────────────────────────

static std::vector<int32_t> make_samples(size_t n, int n_bytes) {
    std::vector<int32_t> s(n);
    int64_t hi = sphere::sample_max_value(n_bytes);
    for (size_t i = 0; i < n; ++i)
        s[i] = static_cast<int32_t>((static_cast<int64_t>(i) * 7919) % hi);
    return s;
}

static std::vector<uint8_t> make_sphere_file(size_t frames, int n_bytes) {
    sphere::MemoryStream mem;
    sphere::Session out(mem, sphere::Mode::Write);
    out.setparams(sphere::Header{
        {"channel_count", int64_t{1}},
        {"sample_rate", int64_t{flag_rate}},
        {"sample_n_bytes", int64_t{n_bytes}},
        {"sample_byte_format", n_bytes == 1 ? std::string("1")
                                            : std::string(n_bytes == 2
                                                              ? "10"
                                                              : "3210")},
    });
    out.writesamples(make_samples(frames, n_bytes));
    out.close();
    return mem.data();
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> audio_durations = {1, 5, 10, 30, 60};

static void add_duration_args(benchmark::internal::Benchmark *b) {
    for (auto d : audio_durations)
        b->Arg(d);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    for (int n_bytes : {1, 2, 4}) {
        // Big-endian formats force a byte shuffle on little-endian hosts.
        std::string fmt = n_bytes == 1 ? "1" : (n_bytes == 2 ? "10" : "3210");

        add_duration_args(benchmark::RegisterBenchmark(
            ("decode_" + std::to_string(n_bytes) + "byte").c_str(),
            [n_bytes, fmt](benchmark::State &state) {
                auto frames = static_cast<size_t>(state.range(0) * flag_rate);
                auto bytes = sphere::encode_samples(
                    make_samples(frames, n_bytes), n_bytes, fmt, 1);
                for (auto _ : state) {
                    auto s = sphere::decode_samples(bytes, n_bytes, fmt, 1,
                                                    frames);
                    benchmark::DoNotOptimize(s.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    static_cast<double>(state.range(0)),
                    benchmark::Counter::kIsRate);
            }));

        add_duration_args(benchmark::RegisterBenchmark(
            ("encode_" + std::to_string(n_bytes) + "byte").c_str(),
            [n_bytes, fmt](benchmark::State &state) {
                auto frames = static_cast<size_t>(state.range(0) * flag_rate);
                auto samples = make_samples(frames, n_bytes);
                for (auto _ : state) {
                    auto b = sphere::encode_samples(samples, n_bytes, fmt, 1);
                    benchmark::DoNotOptimize(b.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    static_cast<double>(state.range(0)),
                    benchmark::Counter::kIsRate);
            }));
    }

    // Full session read from memory: header parse + readframes
    add_duration_args(benchmark::RegisterBenchmark(
        "session_read", [](benchmark::State &state) {
            auto frames = static_cast<size_t>(state.range(0) * flag_rate);
            auto file = make_sphere_file(frames, 2);
            for (auto _ : state) {
                sphere::MemoryStream mem(file);
                sphere::Session in(mem, sphere::Mode::Read);
                auto pcm = in.readframes(in.nframes());
                benchmark::DoNotOptimize(pcm.data());
                in.close();
            }
            state.counters["Throughput"] = benchmark::Counter(
                static_cast<double>(state.range(0)),
                benchmark::Counter::kIsRate);
        }));

    benchmark::RegisterBenchmark("parse_header", [](benchmark::State &state) {
        auto file = make_sphere_file(0, 2);
        for (auto _ : state) {
            auto h = sphere::parse_header(file);
            benchmark::DoNotOptimize(h.size());
        }
    });
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        std::cerr
            << "\nOptions:\n"
            << "  --rate=HZ           Sample rate of the synthetic audio\n"
            << "  --markdown          Output as markdown table\n"
            << std::endl;
        return 1;
    }
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
