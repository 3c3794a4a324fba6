// src/views/ast.cpp
#include "mvcore/views/ast.h"

namespace mvcore {

const char* binary_op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::EQ: return "==";
        case BinaryOp::NE: return "!=";
        case BinaryOp::STRICT_EQ: return "===";
        case BinaryOp::STRICT_NE: return "!==";
        case BinaryOp::LT: return "<";
        case BinaryOp::LE: return "<=";
        case BinaryOp::GT: return ">";
        case BinaryOp::GE: return ">=";
        case BinaryOp::AND: return "&&";
        case BinaryOp::OR: return "||";
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
        case BinaryOp::MOD: return "%";
    }
    return "?";
}

const char* namespace_prefix(Namespace ns) {
    switch (ns) {
        case Namespace::REPOSITORY: return "repository";
        case Namespace::R: return "R";
        case Namespace::APP: return "APP";
        case Namespace::MAIN: return "MAIN";
        case Namespace::MODEL: return "model";
        case Namespace::M: return "M";
        case Namespace::SESSION: return "session";
        case Namespace::QUERY: return "query";
        case Namespace::USER: return "user";
    }
    return "";
}

void Template::extract_sections() {
    for (const auto& node : nodes) {
        if (node->kind != NodeKind::SECTION_DEF) continue;
        const auto& def = static_cast<const SectionDefNode&>(*node);
        // a later definition of the same name replaces the earlier one
        sections[def.name] = def.body;
    }
}

void Template::extract_helpers() {
    for (const auto& node : nodes) {
        if (node->kind != NodeKind::HELPER_DEF) continue;
        const auto& def = static_cast<const HelperDefNode&>(*node);
        helpers[def.helper->name] = def.helper;
    }
}

} // namespace mvcore
