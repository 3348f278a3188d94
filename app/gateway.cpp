#include "gateway.hpp"

int main(int argc, char* argv[]) {
    // logging
    app::logging();
    // gateway config
    app::gateway_t::config_t config;
    // opts::parser
    opts::parser options(argc, argv, "rtcgw-gateway", "webrtc signaling and TURN credential gateway");
    options.get_options().set_width(256);
    meta::add_options(config, options, config.descriptions);
    options.add_default(app::c_config_filename);
    // parsing arguments
    if (!options.parse()) {
        LOG_ERROR_FMT( "error parsing options" );
        return 1;
    }
    auto& parsed = options.get_parsed();
    // help or save options
    if (options.do_default())
        return 0;
    // loading config
    meta::do_parse(config, parsed);
    if (config.debug)
        applog::log::set_level(spdlog::level::debug);
    // logging info
    app::print_info(argc, argv);
    app::print_conf(parsed["config"].as<std::string>());
    app::print_pars("arguments", options);
    LOG_INFO_FMT(
        "encoder: {} @{}fps {}kbps, audio: {} ch @{}bps, resize: {}",
        config.encoder, config.framerate, config.video_bitrate, config.audio_channels, config.audio_bitrate, config.enable_resize
    );
    // gateway
    app::gateway_t gateway(config);
    gateway.settings_file = parsed["config"].as<std::string>();
    gateway.on_help = [&gateway, &options]() -> nlohmann::json {
        return meta::make_help(gateway.config, options.get_options());
    };
    return gateway.run();
}
