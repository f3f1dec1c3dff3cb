#include "FileRecord.hpp"

#include <chrono>

std::string operationIdFor(const FileRecord& record) {
    return record.sourceRoot + "::" + record.relativePath;
}

const char* toString(OperationKind kind) {
    return kind == OperationKind::Move ? "move" : "copy";
}

bool parseOperationKind(const std::string& text, OperationKind& out) {
    if (text == "copy") {
        out = OperationKind::Copy;
        return true;
    }
    if (text == "move") {
        out = OperationKind::Move;
        return true;
    }
    return false;
}

double nowEpochSeconds() {
    const auto since = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since).count();
}
