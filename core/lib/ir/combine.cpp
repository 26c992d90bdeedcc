// xelogen/ir/combine.cpp - Composition of outputs with operands
#include "xelogen/ir/combine.hpp"

#include <fmt/core.h>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/graph.hpp"

namespace xelogen
{

namespace
{

constexpr std::string_view k_increment_int = "PlusOne<Int>";
constexpr std::string_view k_accumulate_int = "Plus<Int>";
constexpr std::string_view k_concat_string = "Plus<String>";
constexpr std::string_view k_int_literal = "IntInput";
constexpr std::string_view k_string_literal = "StringInput";

void require_type(const OutputPort & source, Datatype operand_type)
{
  if (source.datatype() != operand_type) {
    throw BuildError(
      ErrorCode::TypeMismatch,
      fmt::format(
        "cannot combine output '{}' of {} (type {}) with an operand of type {}", source.name(),
        source.node().describe(), to_string(source.datatype()), to_string(operand_type)));
  }
}

/// Plus<T> node over [first, second]
Node & accumulate(
  Graph & graph, std::string_view type, const OutputPort & first, const OutputPort & second)
{
  Node & node = graph.add_node(type);
  const InputPort values = node.input("values");
  values.append(first);
  values.append(second);
  return node;
}

class Combiner
{
public:
  explicit Combiner(const OutputPort & source) : source_(source), graph_(source.node().graph()) {}

  Node & operator()(const IntegerLiteral & lit) const
  {
    require_type(source_, Datatype::Int);
    if (lit.value == 1) {
      Node & node = graph_.add_node(k_increment_int);
      node.bind("value", source_);
      return node;
    }
    Node & literal = graph_.add_node(k_int_literal);
    literal.set_content(ContentValue::make_int(lit.value));
    return accumulate(graph_, k_accumulate_int, source_, literal.only_output());
  }

  Node & operator()(const StringLiteral & lit) const
  {
    require_type(source_, Datatype::String);
    Node & literal = graph_.add_node(k_string_literal);
    literal.set_content(ContentValue::make_string(lit.value));
    return accumulate(graph_, k_concat_string, source_, literal.only_output());
  }

  Node & operator()(const NodeOutput & other) const
  {
    if (&other.output.node().graph() != &graph_) {
      throw BuildError(
        ErrorCode::ForeignNode,
        fmt::format("{} belongs to a different graph", other.output.node().describe()));
    }
    require_type(source_, other.output.datatype());
    switch (source_.datatype()) {
      case Datatype::Int:
        return accumulate(graph_, k_accumulate_int, source_, other.output);
      case Datatype::String:
        // The operand leads the concatenation.
        return accumulate(graph_, k_concat_string, other.output, source_);
      default:
        break;
    }
    throw BuildError(
      ErrorCode::UnsupportedCombination,
      fmt::format(
        "don't know how to combine two {} outputs ({} and {})", to_string(source_.datatype()),
        source_.node().describe(), other.output.node().describe()));
  }

private:
  const OutputPort & source_;
  Graph & graph_;
};

}  // namespace

Node & combine(const OutputPort & source, const Operand & operand)
{
  return std::visit(Combiner(source), operand.value());
}

Node & OutputPort::combine(const Operand & operand) const
{
  return xelogen::combine(*this, operand);
}

}  // namespace xelogen
