#include "AppLogger.h"

namespace {
Stream* gSerial = &Serial;
bool gEnabled = true;
LogLevel gMinLevel = LogLevel::INFO;
std::vector<String> gAllowedChannels;
std::vector<String> gBlockedChannels;
}

void AppLogger::begin(Stream& serial, LogLevel minLevel) {
    gSerial = &serial;
    gEnabled = true;
    gMinLevel = minLevel;
}

void AppLogger::setEnabled(bool enabled) {
    gEnabled = enabled;
}

void AppLogger::setMinLevel(LogLevel minLevel) {
    gMinLevel = minLevel;
}

LogLevel AppLogger::getMinLevel() {
    return gMinLevel;
}

void AppLogger::clearAllowedChannels() {
    gAllowedChannels.clear();
}

void AppLogger::clearBlockedChannels() {
    gBlockedChannels.clear();
}

void AppLogger::allowChannel(const String& channel) {
    String normalized = normalizeChannel(channel);
    if (normalized.length() == 0 || channelInList(gAllowedChannels, normalized)) return;
    gAllowedChannels.push_back(normalized);
}

void AppLogger::blockChannel(const String& channel) {
    String normalized = normalizeChannel(channel);
    if (normalized.length() == 0 || channelInList(gBlockedChannels, normalized)) return;
    gBlockedChannels.push_back(normalized);
}

bool AppLogger::isChannelEnabled(const String& channel) {
    String normalized = normalizeChannel(channel);
    if (normalized.length() == 0) return false;
    if (channelInList(gBlockedChannels, normalized)) return false;
    return gAllowedChannels.empty() || channelInList(gAllowedChannels, normalized);
}

bool AppLogger::isLoggable(LogLevel level, const String& channel) {
    if (!gEnabled || gSerial == nullptr) return false;
    if (level == LogLevel::OFF || level < gMinLevel) return false;
    return isChannelEnabled(channel);
}

void AppLogger::log(LogLevel level, const String& channel, const String& message) {
    if (!isLoggable(level, channel)) return;
    write(level, normalizeChannel(channel), message.c_str());
}

void AppLogger::log(LogLevel level, const String& channel, const char* message) {
    if (!isLoggable(level, channel)) return;
    write(level, normalizeChannel(channel), message ? message : "");
}

void AppLogger::log(LogLevel level, const String& channel, const std::string& message) {
    if (!isLoggable(level, channel)) return;
    write(level, normalizeChannel(channel), message.c_str());
}

void AppLogger::logTo(LogLevel level, const char* channel, const std::string& message) {
    log(level, String(channel), message);
}

void AppLogger::write(LogLevel level, const String& normalizedChannel, const char* message) {
    gSerial->print('[');
    gSerial->print(millis());
    gSerial->print("] [");
    gSerial->print(levelToString(level));
    gSerial->print("] [");
    gSerial->print(normalizedChannel);
    gSerial->print("] ");
    gSerial->println(message);
}

const char* AppLogger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

bool AppLogger::levelFromString(const String& text, LogLevel& level) {
    String name = text;
    name.trim();
    name.toUpperCase();
    if (name == "DEBUG") level = LogLevel::DEBUG;
    else if (name == "INFO") level = LogLevel::INFO;
    else if (name == "WARN" || name == "WARNING") level = LogLevel::WARN;
    else if (name == "ERROR") level = LogLevel::ERROR;
    else if (name == "OFF") level = LogLevel::OFF;
    else return false;
    return true;
}

String AppLogger::normalizeChannel(const String& channel) {
    String normalized = channel;
    normalized.trim();
    normalized.toLowerCase();
    return normalized;
}

bool AppLogger::channelInList(const std::vector<String>& list, const String& normalizedChannel) {
    for (const auto& item : list) {
        if (item == normalizedChannel) return true;
    }
    return false;
}
