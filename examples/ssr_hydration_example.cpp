#include <composespace/ComposeSpace.hpp>

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

using namespace CS;
using namespace CS::Runtime;

namespace {

auto counterApp(Composer& cx) -> void {
    auto& count = cx.savedState("count", 0);
    cx.node("main", [&count](Composer& cx) {
        cx.node("h1", [&count](Composer& cx) { cx.text("Clicked " + std::to_string(count.read()) + " times"); });
        cx.node("button",
                {.handlers = {{"click", [&count](EventPayload const&) { count.update([](int& value) { ++value; }); }}}},
                [](Composer& cx) { cx.text("Click me"); });
    });
}

// Stands in for a DOM: prints every commit and keeps the live handlers.
class PrintingRenderer final : public Renderer {
public:
    auto createOrUpdate(ComponentNode const& node, std::string_view mount_path) -> Expected<void> override {
        auto html = Ssr::HtmlRenderer{Ssr::HtmlOptions{.emit_markers = false}}.render(node);
        if (!html) {
            return std::unexpected(html.error());
        }
        std::cout << "update " << mount_path << ": " << *html << '\n';
        return {};
    }

    auto bindMarker(std::string_view marker_id, LiveHandlers const& handlers) -> Expected<void> override {
        std::cout << "bind " << marker_id << '\n';
        bindings_[std::string{marker_id}] = handlers;
        return {};
    }

    auto click(std::string const& path) -> bool {
        auto it = bindings_.find(path);
        if (it == bindings_.end() || !it->second.contains("click")) {
            return false;
        }
        it->second.at("click")(EventPayload{.name = "click"});
        return true;
    }

private:
    LiveBindings bindings_;
};

} // namespace

int main(int argc, char** argv) {
    int clicks = 1;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--clicks" && idx + 1 < argc) {
            std::string_view value{argv[++idx]};
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), clicks);
            if (ec != std::errc{} || end != value.data() + value.size() || clicks < 0) {
                std::cerr << "--clicks expects a non-negative integer, got '" << value << "'\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--clicks N]\n";
            return 1;
        }
    }

    auto server = Ssr::renderToString(counterApp, {.initial_state = {{"count", Value{3}}}});
    if (!server) {
        std::cerr << "renderToString failed: " << describeError(server.error()) << '\n';
        return 1;
    }
    std::cout << "server html:\n" << server->html << "\n\n";

    PrintingRenderer renderer;
    auto root = Hydration::hydrateRoot(server->context_json, counterApp, renderer, {.mount = {.tag_name = "main"}});
    if (!root) {
        std::cerr << "hydrateRoot failed: " << describeError(root.error()) << '\n';
        return 1;
    }
    std::cout << "hydration: " << Hydration::hydrationPhaseToString(root->report.phase) << ", adopted "
              << root->report.adopted << " node(s)\n";

    for (int i = 0; i < clicks; ++i) {
        if (!renderer.click("root/1")) {
            std::cerr << "button at root/1 has no click handler\n";
            return 1;
        }
        auto report = root->composition->flush();
        for (auto const& error : report.errors) {
            std::cerr << "flush error: " << describeError(error) << '\n';
        }
    }

    if (auto count = root->registry->get("count")) {
        std::cout << "count: " << count->toString() << '\n';
    }
    return 0;
}
