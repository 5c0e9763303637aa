#include <relq/render/backend.hpp>

namespace relq::render {

auto Backend::render(const pipeline::Pipeline& pipeline) const -> Result<std::string> {
    auto text = render_source(pipeline.source());
    if (!text) {
        return text;
    }
    const auto& clauses = pipeline.clauses();
    for (std::size_t i = 1; i < clauses.size(); ++i) {
        auto suffix = render_suffix(clauses[i]);
        if (!suffix) {
            return suffix;
        }
        text->append(*suffix);
    }
    return text;
}

}  // namespace relq::render
