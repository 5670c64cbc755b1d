#include <gtest/gtest.h>
#include <weft/core/diagnostics.h>
#include <weft/layout/layout_engine.h>
#include <weft/widget/tree_builder.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace weft::core;

namespace {

DiagnosticEvent event(Severity severity, const std::string& stage, const std::string& message,
                      std::uint64_t pass = 0, const std::string& subject = {}) {
    DiagnosticEvent e;
    e.severity = severity;
    e.module = "layout";
    e.stage = stage;
    e.message = message;
    e.pass = pass;
    e.subject = subject;
    return e;
}

} // namespace

TEST(DiagnosticsTest, FormatIncludesPassAndSubject) {
    DiagnosticEvent e = event(Severity::Warning, "distribute/axis", "sized to its content", 7, "/0/2");
    EXPECT_EQ(format_diagnostic(e), "[warning] layout/distribute/axis #7 @/0/2: sized to its content");

    e.pass = 0;
    e.subject.clear();
    e.stage.clear();
    EXPECT_EQ(format_diagnostic(e), "[warning] layout: sized to its content");
}

TEST(DiagnosticsTest, EmitStampsMissingTimestamp) {
    DiagnosticEmitter emitter;
    emitter.emit(event(Severity::Info, "begin", "go"));
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_TRUE(emitter.events()[0].timestamp != std::chrono::steady_clock::time_point{});
}

TEST(DiagnosticsTest, MinimumSeverityFiltersEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(event(Severity::Info, "begin", "ignored"));
    emitter.emit(event(Severity::Error, "measure", "kept"));
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
    EXPECT_TRUE(emitter.has_errors());
}

TEST(DiagnosticsTest, ObserversSeeEveryStoredEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(format_diagnostic(e)); });
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(event(Severity::Info, "begin", "dropped", 3));
    emitter.emit(event(Severity::Warning, "distribute/overflow", "full", 3, "/"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "[warning] layout/distribute/overflow #3 @/: full");
}

TEST(DiagnosticsTest, StageQueryMatchesNestedStages) {
    DiagnosticEmitter emitter;
    emitter.emit(event(Severity::Info, "begin", "a"));
    emitter.emit(event(Severity::Warning, "distribute/overflow", "b"));
    emitter.emit(event(Severity::Warning, "distribute/axis", "c"));
    emitter.emit(event(Severity::Warning, "distributed", "d"));
    EXPECT_EQ(emitter.events_by_stage("distribute").size(), 2u);
    EXPECT_EQ(emitter.events_by_stage("distribute/axis").size(), 1u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 3u);
    EXPECT_EQ(emitter.count(Severity::Info), 1u);
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, QueryByPassAndSubject) {
    DiagnosticEmitter emitter;
    emitter.emit(event(Severity::Info, "begin", "a", 1));
    emitter.emit(event(Severity::Warning, "distribute/axis", "b", 1, "/0"));
    emitter.emit(event(Severity::Info, "begin", "c", 2));
    EXPECT_EQ(emitter.events_of_pass(1).size(), 2u);
    ASSERT_EQ(emitter.events_about("/0").size(), 1u);
    EXPECT_EQ(emitter.events_about("/0")[0].message, "b");
}

TEST(DiagnosticsTest, ConcurrentEmitKeepsEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::thread> threads;
    for (int t = 1; t <= 4; ++t) {
        threads.emplace_back([&emitter, t] {
            for (int i = 0; i < 50; ++i) {
                emitter.emit(event(Severity::Info, "begin", "x", static_cast<std::uint64_t>(t)));
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(emitter.size(), 200u);
    EXPECT_EQ(emitter.events_of_pass(3).size(), 50u);
}

TEST(DiagnosticsTest, EachLayoutPassIsNumbered) {
    using namespace weft::widget;
    using namespace weft::layout;

    WidgetTreeBuilder b;
    NodeId root = b.add_root(Stack{Axis::Vertical});
    b.add_child(root, Expand{});
    auto built = b.build();
    ASSERT_TRUE(built.ok);

    DiagnosticEmitter emitter;
    LayoutEngine engine;
    engine.set_diagnostics(&emitter);
    ASSERT_TRUE(engine.compute(built.tree, Extent{4, 4}).ok);
    ASSERT_TRUE(engine.compute(built.tree, Extent{4, 4}).ok);

    auto begins = emitter.events_by_stage("begin");
    auto ends = emitter.events_by_stage("end");
    ASSERT_EQ(begins.size(), 2u);
    ASSERT_EQ(ends.size(), 2u);
    EXPECT_EQ(begins[0].pass, 1u);
    EXPECT_EQ(begins[1].pass, 2u);
    EXPECT_TRUE(begins[0].subject.empty());
    EXPECT_EQ(begins[0].module, "layout");
    EXPECT_EQ(begins[0].message, "2 nodes in 4x4");
    EXPECT_TRUE(emitter.events_by_severity(Severity::Warning).empty());
}
