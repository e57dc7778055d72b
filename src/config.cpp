#include "config.hpp"

#include <stdexcept>

ResumePolicy parse_resume_policy(const std::string& name) {
    if (name == "position") return ResumePolicy::Position;
    if (name == "restart") return ResumePolicy::RestartTrack;
    throw std::invalid_argument("Unknown resume policy: " + name);
}

EndPolicy parse_end_policy(const std::string& name) {
    if (name == "stop") return EndPolicy::Stop;
    if (name == "loop") return EndPolicy::Loop;
    throw std::invalid_argument("Unknown end policy: " + name);
}

RemovalPolicy parse_removal_policy(const std::string& name) {
    if (name == "stop") return RemovalPolicy::Stop;
    if (name == "keep") return RemovalPolicy::KeepPlaying;
    throw std::invalid_argument("Unknown removal policy: " + name);
}
