#pragma once
#include "common.hpp"
#include "chartypes.hpp"
#include "token.hpp"
#include "error.hpp"
#include "config_default.hpp"
#include "config.hpp"
#include "call_lexer.hpp"
#include "syntax_lexer.hpp"
#include "symbol_table.hpp"
#include "node.hpp"
#include "call_match.hpp"
#include "matcher.hpp"
#include "match.hpp"
#include "syntax_tree.hpp"
#include "syntax_parser.hpp"
#include "dispatcher.hpp"
