#include "input_handler.h"
#include "readline_input_handler.h"
#include "pipeline_config.h"

namespace forge {

std::unique_ptr<InputHandler> create_input_handler() {
    return std::make_unique<ReadlineInputHandler>(PipelineConfig::get_forge_directory() + "/history");
}

} // namespace forge
