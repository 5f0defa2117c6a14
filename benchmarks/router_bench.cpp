// Router benchmarks:
//  - registration of a small route table
//  - dispatch over static, wildcard and deep routes

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "segmux/core/http_request.h"
#include "segmux/core/http_response.h"
#include "segmux/core/http_router.h"
#include "segmux/core/request_context.h"

namespace segmux::core {

namespace {

void noop_handler(HttpRequest&, HttpResponse&, RequestContext&) {}

struct RouteArgs {
    const char* pattern;
    const char* method;
};

struct BenchCase {
    std::vector<RouteArgs> routes;
    const char* path;
    const char* method;
};

const std::vector<BenchCase>& cases() {
    static const std::vector<BenchCase> all = {
        {{{"/foo", "GET"}}, "/foo", "GET"},
        {{{"/*", "GET"}}, "/foo", "GET"},
        {{{"/*", "*"}}, "/foo", "GET"},
        {{{"/", "GET"}, {"/posts", "GET"}, {"/posts", "POST"}, {"/posts/*", "GET"},
          {"/posts/*", "PUT"}, {"/posts/*/comments", "GET"}, {"/users", "GET"}, {"/users/*", "GET"}},
         "/posts/7/comments", "GET"},
        {{{"/a/b/c/d/e/f/g/h/i/j", "GET"}}, "/a/b/c/d/e/f/g/h/i/j", "GET"},
        {{{"/*/*/*/*/*/*/*/*/*/*", "GET"}}, "/a/b/c/d/e/f/g/h/i/j", "GET"},
    };
    return all;
}

void register_case(HttpRouter& router, const BenchCase& bench_case) {
    for (const auto& route : bench_case.routes) {
        router.add_route(route.method, route.pattern, noop_handler);
    }
}

} // namespace

static void BM_RouterRegister(benchmark::State& state) {
    const auto& bench_case = cases()[static_cast<std::size_t>(state.range(0))];
    for (auto _ : state) {
        HttpRouter router;
        register_case(router, bench_case);
        benchmark::DoNotOptimize(&router);
    }
}
BENCHMARK(BM_RouterRegister)->DenseRange(0, 5);

static void BM_RouterMatch(benchmark::State& state) {
    const auto& bench_case = cases()[static_cast<std::size_t>(state.range(0))];
    HttpRouter router;
    register_case(router, bench_case);

    const std::string method = bench_case.method;
    const std::string path = bench_case.path;
    for (auto _ : state) {
        auto result = router.match(method, path);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RouterMatch)->DenseRange(0, 5);

static void BM_RouterRoute(benchmark::State& state) {
    const auto& bench_case = cases()[static_cast<std::size_t>(state.range(0))];
    HttpRouter router;
    register_case(router, bench_case);

    for (auto _ : state) {
        HttpRequest request(bench_case.method, bench_case.path);
        HttpResponse response;
        RequestContext context;
        benchmark::DoNotOptimize(router.route(request, response, context));
    }
}
BENCHMARK(BM_RouterRoute)->DenseRange(0, 5);

} // namespace segmux::core
