#include "beatfield/systems/audio_bounce.hpp"

namespace Systems {

double AudioBounce::targetEnergy(Components::BandCategory band,
                                 const Components::AudioState& audio,
                                 const AudioBounceConfig& config)
{
    double target = 0.0;
    double bonus = 0.0;

    switch (band) {
        case Components::BandCategory::Bass:
            target = audio.bass * config.BassWeight + audio.mid * config.BassMidCrossWeight;
            bonus = config.BassBeatBonus;
            break;
        case Components::BandCategory::Mid:
            target = audio.mid * config.MidWeight;
            bonus = config.MidBeatBonus;
            break;
        case Components::BandCategory::Treble:
            target = audio.treble * config.TrebleWeight;
            bonus = config.TrebleBeatBonus;
            break;
    }

    if (audio.beatDetected) {
        target += bonus;
    }
    return target;
}

double AudioBounce::smooth(double current, double target,
                           Components::BandCategory band,
                           const AudioBounceConfig& config)
{
    double const alpha = (band == Components::BandCategory::Bass)
        ? config.BassSmoothing
        : config.OtherSmoothing;
    return current * (1.0 - alpha) + target * alpha;
}

bool AudioBounce::applyFloorImpulse(const Components::Position& pos,
                                    Components::Velocity& vel,
                                    double radius, double floorY, double mass,
                                    double energy,
                                    const AudioBounceConfig& config)
{
    bool const resting = pos.y >= floorY - radius && vel.y >= 0.0;
    if (!resting || energy <= config.ImpulseThreshold) {
        return false;
    }
    vel.y = -energy * config.ImpulseScale * mass;
    return true;
}

} // namespace Systems
