#include "text_processing.hpp"
#include "utils.hpp"

using namespace std;

namespace text_processing
{
    int countCharacters(const string &text)
    {
        int count = 0;
        for (unsigned char c : text)
        {
            // Skip UTF-8 continuation bytes
            if ((c & 0xC0) != 0x80)
                count++;
        }
        return count;
    }

    TextAnalysis evaluate(const vector<TextRegion> &regions, int image_height, const TextParams &params)
    {
        TextAnalysis analysis;
        if (regions.empty())
            return analysis;

        double confidenceSum = 0.0;
        int bottomRegions = 0;
        double bottomThirdY = image_height * 2.0 / 3.0;

        for (const auto &region : regions)
        {
            int chars = countCharacters(region.text);
            analysis.total_chars += chars;
            confidenceSum += region.confidence;

            if (region.confidence > params.high_confidence)
                analysis.high_conf_regions++;
            if (chars > params.large_block_chars)
                analysis.large_text_blocks++;
            if (region.top > bottomThirdY)
                bottomRegions++;
        }

        double regionCount = static_cast<double>(regions.size());
        analysis.avg_confidence = confidenceSum / regionCount;
        analysis.has_bottom_text = bottomRegions > regionCount / 2.0;
        analysis.text_density = analysis.total_chars / regionCount;

        // Threshold rule, always applied
        if (analysis.total_chars >= params.min_chars && analysis.avg_confidence >= params.min_confidence)
        {
            analysis.screenshot = true;
        }
        else if (params.extra_heuristics)
        {
            // Caption rule: several confident, long text blocks sitting at the bottom
            if (analysis.high_conf_regions >= params.caption_min_regions &&
                analysis.large_text_blocks >= params.caption_min_regions &&
                analysis.has_bottom_text &&
                analysis.total_chars >= params.caption_min_chars &&
                analysis.text_density > params.caption_min_density)
            {
                analysis.screenshot = true;
            }
            // Dense text rule: lots of readable text per region
            else if (analysis.text_density > params.dense_min_density &&
                     analysis.avg_confidence > params.dense_min_confidence &&
                     analysis.total_chars >= params.dense_min_chars)
            {
                analysis.screenshot = true;
            }
        }

        log_debug("OCR metrics: chars=" + to_string(analysis.total_chars) +
                  " avg_conf=" + to_string(analysis.avg_confidence) +
                  " high_conf=" + to_string(analysis.high_conf_regions) +
                  " large_blocks=" + to_string(analysis.large_text_blocks) +
                  " bottom_text=" + string(analysis.has_bottom_text ? "yes" : "no") +
                  " density=" + to_string(analysis.text_density));

        return analysis;
    }

} // namespace text_processing
