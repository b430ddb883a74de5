#ifndef TBC_PAGE_FEED_H
#define TBC_PAGE_FEED_H

#include "layout/tbc_layout_span.h"
#include "layout/tbc_layout_drawing.h"

#include <vector>

// Everything the clustering pipeline reads for one page
struct tbc_page_feed
{
  std::vector<tbc_span> spans;
  std::vector<tbc_drawing> drawings;
  std::vector<tbc_hyperlink> links;
  double page_width = 0.0;
  double page_height = 0.0;
};

#endif // TBC_PAGE_FEED_H
