#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/cfg.hpp"
#include "debug/cnt.hpp"
#include "debug/rep.hpp"
#include "debug/rpl.hpp"
#include "debug/tbl.hpp"

// 使用例:
// debug::rep::log(debug::rep::Id::EnterLibrary, "package:foo/foo.dart");
// debug::tbl::log(debug::tbl::Id::Widen, "TE", debug::Level::Trace);
