#ifndef SKULD_CONFIG_HPP
#define SKULD_CONFIG_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/settings.hpp"

namespace Skuld::Config {
    using FitSettings = Details::FitSettings;
    using PipelineSettings = Details::PipelineSettings;
    using SearchSettings = Details::SearchSettings;
    using Settings = Details::Settings;

    using Details::to_string;
    using Details::parse_attention_policy;
    using Details::model_spec;
    using Details::fit_options;
    using Details::pipeline_options;
    using Details::training_plan_options;
    using Details::search_options;
    using Details::space_options;
    using Details::to_property_tree;
    using Details::settings_from_property_tree;
    using Details::load_settings;
    using Details::save_settings;
}

#endif // SKULD_CONFIG_HPP
