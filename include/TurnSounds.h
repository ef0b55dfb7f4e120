#pragma once

#include <SFML/Audio.hpp>

#include <memory>
#include <random>
#include <string>
#include <vector>

// Pool of layer-turn clips; one is picked at random per move and pitched
// so its length roughly matches the animation.
class TurnSounds {
public:
    TurnSounds() = default;
    ~TurnSounds();

    TurnSounds(const TurnSounds&) = delete;
    TurnSounds& operator=(const TurnSounds&) = delete;

    // Returns the number of clips loaded; unreadable files are reported and skipped
    size_t load(const std::vector<std::string>& paths, float volume = 70.0f);

    void play(float moveDuration);
    void stopAll();

private:
    struct Clip {
        sf::SoundBuffer buffer;
        sf::Sound sound;
    };

    std::vector<std::unique_ptr<Clip>> clips;
    float volume{70.0f};
    std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<float> pitchJitter{0.9f, 1.1f};
};
