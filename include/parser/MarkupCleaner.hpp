#pragma once
#include <string>

namespace TableScrape {

// Rewrites table markup that trips up a structural tokenizer:
//   <table A></table B>      -> <table A B>
//   <td .../>, <th .../>     -> <td ...></td>, <th ...></th>
//   </table></table>         -> </table>
// Only tags are touched; text passes through unchanged.
std::string cleanMalformedMarkup(const std::string& html);

}
