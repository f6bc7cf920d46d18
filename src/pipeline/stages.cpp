#include "mono_cbp/pipeline/stages.hpp"
#include "mono_cbp/io/light_curve_store.hpp"

namespace mono_cbp::pipeline {

std::unique_ptr<masking::EclipseMasker> StageFactory::make_eclipse_masker(const StageContext& ctx) {
    auto store = std::make_shared<io::FitsLightCurveStore>(ctx.options.data_dir,
                                                           ctx.config.eclipse_masking.file_pattern);
    return std::make_unique<masking::CatalogueEclipseMasker>(
        ctx.catalogue, std::move(store), ctx.config.eclipse_masking, ctx.events, ctx.run_id);
}

} // namespace mono_cbp::pipeline
