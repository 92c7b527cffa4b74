#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "get_content": readable text plus the first links and images.

static StepResult handle_get_content(const parser::Action &action, StepContext &context) {
    (void)action;

    browser_driver::PageContentResult content_result = context.lease->page().get_content();
    if (!content_result.success) {
        return action_registry::driver_failure(content_result.timed_out, "get content",
                                               content_result.error_detail);
    }

    json links = json::array();
    for (const auto &link : content_result.links) {
        links.push_back(json{{"text", link.text}, {"href", link.href}});
    }
    json images = json::array();
    for (const auto &image : content_result.images) {
        images.push_back(json{{"src", image.src}, {"alt", image.alt}});
    }

    json data;
    data["title"] = content_result.title;
    data["url"] = content_result.url;
    data["text"] = content_result.text;
    data["links"] = links;
    data["images"] = images;

    std::string message = "Content of " +
        (content_result.title.empty() ? content_result.url : content_result.title) + " (" +
        std::to_string(content_result.text.size()) + " chars, " + std::to_string(links.size()) +
        " links, " + std::to_string(images.size()) + " images)";
    return action_registry::ok_step(message, data);
}

namespace action_get_content {

void register_action() {
    action_registry::register_action({
        parser::Verb::GetContent,
        "Return the page's title, URL, visible text, links and images.",
        handle_get_content
    });
}

} // namespace action_get_content
