#include "ai_text_provider.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

CommandTextClient::CommandTextClient(const std::string& command) : command_(command) {}

bool CommandTextClient::complete(const std::string& prompt, std::string& response, std::string& errorMsg) {
    char tmp_path[] = "/tmp/matchcut_prompt_XXXXXX";
    int fd = mkstemp(tmp_path);
    if (fd < 0) {
        errorMsg = std::string("could not create prompt file: ") + std::strerror(errno);
        return false;
    }

    size_t written = 0;
    while (written < prompt.size()) {
        ssize_t n = write(fd, prompt.data() + written, prompt.size() - written);
        if (n <= 0) {
            errorMsg = std::string("could not write prompt file: ") + std::strerror(errno);
            close(fd);
            unlink(tmp_path);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    close(fd);

    std::string cmd = command_ + " < " + tmp_path;
    LOG_DEBUG("Running text command: " << cmd);
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        errorMsg = std::string("could not start text command: ") + std::strerror(errno);
        unlink(tmp_path);
        return false;
    }

    response.clear();
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        response.append(buffer, n);
    }
    int status = pclose(pipe);
    unlink(tmp_path);

    if (status != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : status;
        errorMsg = "text command exited with status " + std::to_string(code);
        return false;
    }
    return true;
}

std::string buildTextPrompt(const std::string& highlight, int target_lines, int min_chars, int max_chars) {
    std::ostringstream prompt;
    prompt << "You are a creative writer. "
           << "Task: Generate exactly " << target_lines
           << " lines of coherent, natural text in a single language (no more, no less).\n\n"
           << "Rules:\n"
           << "1. Each line MUST be a complete, meaningful sentence in natural language\n"
           << "2. One line MUST contain exactly this phrase: '" << highlight << "'\n"
           << "3. IMPORTANT: Each line MUST be " << min_chars << "-" << max_chars
           << " characters long (no short lines)\n"
           << "4. Create a coherent paragraph where all lines relate to each other\n"
           << "5. The text should flow naturally with the highlighted phrase integrated seamlessly\n"
           << "6. Every line must be substantial and meaningful, not just filler text\n\n"
           << "Format:\n"
           << "- Return ONLY the lines of text\n"
           << "- Separate lines with single newlines\n"
           << "- No numbering, no quotes, no extra formatting\n"
           << "- EVERY line must be a complete sentence with proper punctuation\n";
    return prompt.str();
}

std::vector<std::string> cleanAiResponse(const std::string& content) {
    std::string cleaned = content;
    replaceAllInPlace(cleaned, "```", "");
    replaceAllInPlace(cleaned, "**", "");

    std::vector<std::string> lines;
    for (const auto& raw : splitLines(cleaned)) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == '-' || line[0] == '*' ||
            startsWith(line, "Note:") || startsWith(line, "Format:")) {
            continue;
        }

        // "12. Text" -> "Text"
        size_t digits = 0;
        while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
            digits++;
        }
        if (digits > 0 && digits + 1 < line.size() && line[digits] == '.' && line[digits + 1] == ' ') {
            line = trim(line.substr(digits + 2));
            if (line.empty()) continue;
        }
        lines.push_back(line);
    }
    return lines;
}

bool selectSnippetLines(const std::vector<std::string>& lines,
                        const std::string& highlight,
                        const TextBounds& bounds,
                        TextSnippet& snippet,
                        std::string& errorMsg) {
    std::vector<std::string> valid;
    bool have_highlight = false;
    for (const auto& line : lines) {
        const int length = static_cast<int>(line.size());
        if (length < bounds.min_chars || length > bounds.max_chars) continue;
        if (line.find(' ') == std::string::npos) continue;
        if (splitWords(line).size() < 5) continue;
        if (!hasTerminalPunctuation(line)) continue;

        if (line.find(highlight) != std::string::npos) {
            if (have_highlight) continue;
            have_highlight = true;
        }
        valid.push_back(line);
    }

    if (!have_highlight) {
        errorMsg = "no valid line contains \"" + highlight + "\"";
        return false;
    }

    snippet.lines.clear();
    snippet.highlight_line_index = -1;
    int others_left = bounds.max_lines - 1;
    for (const auto& line : valid) {
        if (line.find(highlight) != std::string::npos) {
            snippet.highlight_line_index = static_cast<int>(snippet.lines.size());
            snippet.lines.push_back(line);
        } else if (others_left > 0) {
            snippet.lines.push_back(line);
            others_left--;
        }
    }

    if (static_cast<int>(snippet.lines.size()) < bounds.min_lines) {
        errorMsg = "only " + std::to_string(snippet.lines.size()) + " usable lines, need " +
                   std::to_string(bounds.min_lines);
        return false;
    }
    return true;
}

AiTextProvider::AiTextProvider(std::unique_ptr<TextGenerationClient> client, int min_chars, int max_chars, int attempts)
    : client_(std::move(client)), min_chars_(min_chars), max_chars_(max_chars), attempts_(attempts) {}

TextGenerationResult AiTextProvider::generate(const std::string& highlight, int min_lines, int max_lines) {
    TextBounds bounds;
    bounds.min_lines = min_lines;
    bounds.max_lines = max_lines;
    bounds.min_chars = min_chars_;
    bounds.max_chars = max_chars_;

    // Ask for the maximum so the frame fills up after filtering
    const std::string prompt = buildTextPrompt(highlight, max_lines, min_chars_, max_chars_);

    std::string last_error = "no attempts made";
    for (int attempt = 1; attempt <= attempts_; attempt++) {
        std::string response;
        std::string errorMsg;
        if (!client_->complete(prompt, response, errorMsg)) {
            LOG_DEBUG("AI attempt " << attempt << "/" << attempts_ << " failed: " << errorMsg);
            last_error = errorMsg;
            continue;
        }

        TextGenerationResult result;
        if (!selectSnippetLines(cleanAiResponse(response), highlight, bounds, result.snippet, errorMsg)) {
            LOG_DEBUG("AI attempt " << attempt << "/" << attempts_ << " rejected: " << errorMsg);
            last_error = errorMsg;
            continue;
        }
        if (!validateSnippet(result.snippet, highlight, bounds, errorMsg)) {
            last_error = errorMsg;
            continue;
        }
        LOG_DEBUG("AI text accepted on attempt " << attempt << " (" << result.snippet.lines.size() << " lines)");
        return result;
    }

    return TextGenerationResult::failure("AI text rejected after " + std::to_string(attempts_) +
                                         " attempts: " + last_error);
}
