#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include <nlohmann/json.hpp>

using namespace tutorgate::gateway;
using json = nlohmann::json;

void test_generated_ids() {
    std::cout << "Testing correlation id generation..." << std::endl;

    RequestTracer tracer(std::make_shared<Observability>("test_tracer"));
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = tracer.generate_id();
        assert(id.size() == 32);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        seen.insert(id);
    }
    assert(seen.size() == 1000);

    std::cout << "✓ Id generation test passed" << std::endl;
}

void test_incoming_id_validation() {
    std::cout << "Testing incoming correlation id validation..." << std::endl;

    assert(RequestTracer::is_valid_correlation_id("req-123_ABC"));
    assert(RequestTracer::is_valid_correlation_id(std::string(64, 'a')));
    assert(!RequestTracer::is_valid_correlation_id(""));
    assert(!RequestTracer::is_valid_correlation_id(std::string(65, 'a')));
    assert(!RequestTracer::is_valid_correlation_id("has space"));
    assert(!RequestTracer::is_valid_correlation_id("line\nbreak"));
    assert(!RequestTracer::is_valid_correlation_id("{\"inject\":1}"));

    std::cout << "✓ Incoming id validation test passed" << std::endl;
}

void test_begin_adopts_or_replaces() {
    std::cout << "Testing trace begin..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_tracer");
    observability->set_log_stream(&logs);
    observability->set_min_level(LogLevel::debug);
    RequestTracer tracer(observability);

    TraceContext adopted = tracer.begin("student-7", EndpointClass::execute, "upstream-id-42");
    assert(adopted.correlation_id == "upstream-id-42");
    assert(adopted.client_id == "student-7");
    assert(adopted.endpoint == "execute");
    assert(adopted.breadcrumbs.size() == 1);
    assert(adopted.breadcrumbs[0] == "ingress");

    TraceContext fresh = tracer.begin("student-7", EndpointClass::ask);
    assert(fresh.correlation_id.size() == 32);
    assert(logs.str().find("Replaced malformed") == std::string::npos);

    TraceContext replaced = tracer.begin("student-7", EndpointClass::ask, "bad id!");
    assert(replaced.correlation_id != "bad id!");
    assert(replaced.correlation_id.size() == 32);
    assert(logs.str().find("Replaced malformed incoming correlation id") != std::string::npos);

    std::cout << "✓ Trace begin test passed" << std::endl;
}

void test_breadcrumbs() {
    std::cout << "Testing breadcrumbs..." << std::endl;

    TraceContext trace;
    RequestTracer::breadcrumb(trace, "ingress");
    RequestTracer::breadcrumb(trace, "rate_limiter");
    RequestTracer::breadcrumb(trace, "rate_limiter");
    RequestTracer::breadcrumb(trace, "policy");
    RequestTracer::breadcrumb(trace, "rate_limiter");

    // Consecutive repeats collapse; a later revisit is kept
    assert(trace.breadcrumbs.size() == 4);
    assert(trace.breadcrumbs[1] == "rate_limiter");
    assert(trace.breadcrumbs[2] == "policy");
    assert(trace.breadcrumbs[3] == "rate_limiter");

    std::cout << "✓ Breadcrumb test passed" << std::endl;
}

void test_finish_emits_summary() {
    std::cout << "Testing egress summary line..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_tracer");
    observability->set_log_stream(&logs);
    RequestTracer tracer(observability);

    TraceContext trace = tracer.begin("student-9", EndpointClass::execute, "corr-finish");
    RequestTracer::breadcrumb(trace, "rate_limiter");
    RequestTracer::breadcrumb(trace, "sandbox");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    tracer.finish(trace, "ok");

    std::string line = logs.str();
    line = line.substr(0, line.find('\n'));
    json entry = json::parse(line);
    assert(entry["message"] == "Request completed");
    assert(entry["correlation_id"] == "corr-finish");
    assert(entry["client_id"] == "student-9");
    assert(entry["context"]["endpoint"] == "execute");
    assert(entry["context"]["outcome"] == "ok");
    assert(entry["context"]["path"] == "ingress>rate_limiter>sandbox");
    assert(std::stoll(entry["context"]["duration_ms"].get<std::string>()) >= 5);

    std::cout << "✓ Egress summary test passed" << std::endl;
}

int main() {
    std::cout << "=== Request Tracer Tests ===" << std::endl;
    unsetenv("TUTORGATE_LOG_LEVEL");

    try {
        test_generated_ids();
        test_incoming_id_validation();
        test_begin_adopts_or_replaces();
        test_breadcrumbs();
        test_finish_emits_summary();

        std::cout << "\n=== All tests passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
