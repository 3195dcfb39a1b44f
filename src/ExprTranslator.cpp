#include "pyduino/ExprTranslator.h"

#include "pyduino/Operators.h"
#include "pyduino/StringLiteral.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace pyduino {

namespace {
const char *kPlaceholderReceiver = "obj";

std::string renderReceiver(const Expr &receiver) {
  if (isSimpleName(receiver)) {
    return receiver.name;
  }
  return kPlaceholderReceiver;
}

std::string renderLiteral(const Expr &expr) {
  switch (expr.literalKind) {
  case Expr::LiteralKind::Int:
  case Expr::LiteralKind::Float:
    return expr.literalText;
  case Expr::LiteralKind::String:
    return quoteCString(expr.literalText);
  case Expr::LiteralKind::Bool:
    return expr.literalText == "true" ? "true" : "false";
  case Expr::LiteralKind::None:
    return "NULL";
  case Expr::LiteralKind::Other:
    return "0";
  }
  return "0";
}

bool isSleepCall(const Expr &call) {
  if (call.operands.empty() || call.args.size() != 1) {
    return false;
  }
  const Expr &callee = call.operands.front();
  return callee.kind == Expr::Kind::Attribute && callee.name == "sleep" && !callee.operands.empty() &&
         isSimpleName(callee.operands.front()) && callee.operands.front().name == "time";
}

std::string renderSleep(const Expr &arg) {
  if (arg.kind == Expr::Kind::Literal &&
      (arg.literalKind == Expr::LiteralKind::Int || arg.literalKind == Expr::LiteralKind::Float)) {
    double millis = std::strtod(arg.literalText.c_str(), nullptr) * 1000.0;
    // Literals beyond the long long range keep the runtime multiplication.
    if (std::isfinite(millis) && std::fabs(millis) < 9.0e18) {
      return "delay(" + std::to_string(std::llround(millis)) + ")";
    }
  }
  return "delay(" + renderExpr(arg) + " * 1000)";
}

std::string renderCall(const Expr &expr) {
  if (expr.operands.empty()) {
    return "0";
  }
  if (isSleepCall(expr)) {
    return renderSleep(expr.args.front());
  }
  const Expr &callee = expr.operands.front();
  std::string target;
  switch (callee.kind) {
  case Expr::Kind::Name:
    target = callee.name;
    break;
  case Expr::Kind::Attribute:
    if (callee.operands.empty()) {
      return "0";
    }
    target = renderReceiver(callee.operands.front()) + "." + callee.name;
    break;
  case Expr::Kind::Call:
    target = renderCall(callee);
    break;
  default:
    return "0";
  }
  return target + "(" + renderArguments(expr.args) + ")";
}

std::string renderCompare(const Expr &expr) {
  if (expr.operands.size() != expr.compareOps.size() + 1 || expr.compareOps.empty()) {
    return "0";
  }
  for (CompareOperator op : expr.compareOps) {
    if (!isSupportedCompareOperator(op)) {
      return "0";
    }
  }
  std::vector<std::string> links;
  for (size_t i = 0; i < expr.compareOps.size(); ++i) {
    links.push_back("(" + renderExpr(expr.operands[i]) + " " + compareOperatorSpelling(expr.compareOps[i]) + " " +
                    renderExpr(expr.operands[i + 1]) + ")");
  }
  if (links.size() == 1) {
    return links.front();
  }
  std::string out = "(";
  for (size_t i = 0; i < links.size(); ++i) {
    if (i > 0) {
      out += " && ";
    }
    out += links[i];
  }
  out += ")";
  return out;
}
} // namespace

bool isSimpleName(const Expr &expr) {
  return expr.kind == Expr::Kind::Name && !expr.name.empty();
}

std::string renderArguments(const std::vector<Expr> &args) {
  std::ostringstream out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << renderExpr(args[i]);
  }
  return out.str();
}

std::string renderExpr(const Expr &expr) {
  switch (expr.kind) {
  case Expr::Kind::Name:
    return expr.name.empty() ? "0" : expr.name;
  case Expr::Kind::Literal:
    return renderLiteral(expr);
  case Expr::Kind::BinaryOp:
    if (expr.operands.size() != 2) {
      return "0";
    }
    if (expr.binaryOp == BinaryOperator::Pow) {
      return "pow(" + renderExpr(expr.operands[0]) + ", " + renderExpr(expr.operands[1]) + ")";
    }
    return "(" + renderExpr(expr.operands[0]) + " " + binaryOperatorSpelling(expr.binaryOp) + " " +
           renderExpr(expr.operands[1]) + ")";
  case Expr::Kind::UnaryOp:
    if (expr.operands.size() != 1) {
      return "0";
    }
    return std::string("(") + unaryOperatorSpelling(expr.unaryOp) + renderExpr(expr.operands[0]) + ")";
  case Expr::Kind::BoolOp: {
    if (expr.operands.empty()) {
      return "0";
    }
    std::string out = "(";
    for (size_t i = 0; i < expr.operands.size(); ++i) {
      if (i > 0) {
        out += std::string(" ") + boolOperatorSpelling(expr.boolOp) + " ";
      }
      out += renderExpr(expr.operands[i]);
    }
    out += ")";
    return out;
  }
  case Expr::Kind::Compare:
    return renderCompare(expr);
  case Expr::Kind::Call:
    return renderCall(expr);
  case Expr::Kind::Attribute:
    if (expr.operands.empty()) {
      return "0";
    }
    return renderReceiver(expr.operands.front()) + "." + expr.name;
  case Expr::Kind::Unsupported:
    return "0";
  }
  return "0";
}

std::string wrapCondition(const std::string &text) {
  if (text.size() >= 2 && text.front() == '(' && text.back() == ')') {
    int depth = 0;
    bool inString = false;
    for (size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (inString) {
        if (c == '\\') {
          ++i;
        } else if (c == '"') {
          inString = false;
        }
        continue;
      }
      if (c == '"') {
        inString = true;
      } else if (c == '(') {
        ++depth;
      } else if (c == ')') {
        --depth;
        if (depth == 0 && i + 1 < text.size()) {
          return "(" + text + ")";
        }
      }
    }
    return text;
  }
  return "(" + text + ")";
}

} // namespace pyduino
